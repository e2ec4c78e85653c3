#ifndef SETTINGS_H
#define SETTINGS_H

#include <QtGlobal>
#include <QSettings>
#include <QString>

class Settings
{
private:
	int min_gap_min_;
	int duplicate_overlap_pct_;
	int severity_high_pct_;
	int severity_medium_pct_;
	bool label_containment_;
	int mergeable_max_gap_sec_;
	int duration_tolerance_sec_;
	bool widen_longest_survivor_;
	QString database_file_;
	bool log_to_file_;
	QString log_file_;
	QSettings sfile_;

	void readSettingsFile();
	void writeSettingsFile();

public:
	Settings(const QString filename);
	qint64 getMinGapSec() const;
	double getDuplicateOverlapRatio() const;
	double getHighSeverityRatio() const;
	double getMediumSeverityRatio() const;
	bool isLabelContainmentEnabled() const;
	qint64 getMergeableMaxGapSec() const;
	qint64 getDurationToleranceSec() const;
	bool isWidenLongestSurvivorEnabled() const;
	QString getDatabaseFile() const;
	bool logToFile() const;
	QString getLogFile() const;
	void setMinGapMinutes(const int minutes);
	void setDatabaseFile(const QString& filename);
};

#endif // SETTINGS_H
