#include "settings.h"

Settings::Settings(const QString filename) : sfile_(filename, QSettings::IniFormat)
{
	sfile_.setIniCodec("UTF-8");
	readSettingsFile();
	sfile_.clear();
	writeSettingsFile();
}

void Settings::readSettingsFile()
{
	min_gap_min_ = qBound(0, sfile_.value("uReconcile/min_gap_minutes", 15).toInt(), 24*60);
	duplicate_overlap_pct_ = qBound(1, sfile_.value("uReconcile/duplicate_overlap_percent", 95).toInt(), 100);
	severity_high_pct_ = qBound(1, sfile_.value("uReconcile/severity_high_percent", 75).toInt(), 100);
	severity_medium_pct_ = qBound(0, sfile_.value("uReconcile/severity_medium_percent", 25).toInt(), severity_high_pct_);
	label_containment_ = (sfile_.value("uReconcile/label_match_mode", "containment").toString().trimmed().toLower() != "exact");
	mergeable_max_gap_sec_ = qBound(0, sfile_.value("uReconcile/mergeable_max_gap_seconds", 300).toInt(), 24*60*60);
	duration_tolerance_sec_ = qBound(0, sfile_.value("uReconcile/duration_tolerance_seconds", 1).toInt(), 60*60);
	widen_longest_survivor_ = sfile_.value("uReconcile/widen_longest_survivor", false).toBool();
	database_file_ = sfile_.value("uReconcile/database_file", "ureconcile.sqlite").toString();
	if (database_file_.trimmed().isEmpty())
		database_file_ = "ureconcile.sqlite";
	log_to_file_ = sfile_.value("uReconcile/debug_log_to_file", false).toBool();
	log_file_ = sfile_.value("uReconcile/log_file", "ureconcile.log").toString().trimmed();
	if (log_file_.isEmpty())
		log_file_ = "ureconcile.log";
}

void Settings::writeSettingsFile()
{
	sfile_.setValue("uReconcile/min_gap_minutes", min_gap_min_);
	sfile_.setValue("uReconcile/duplicate_overlap_percent", duplicate_overlap_pct_);
	sfile_.setValue("uReconcile/severity_high_percent", severity_high_pct_);
	sfile_.setValue("uReconcile/severity_medium_percent", severity_medium_pct_);
	sfile_.setValue("uReconcile/label_match_mode", label_containment_ ? "containment" : "exact");
	sfile_.setValue("uReconcile/mergeable_max_gap_seconds", mergeable_max_gap_sec_);
	sfile_.setValue("uReconcile/duration_tolerance_seconds", duration_tolerance_sec_);
	sfile_.setValue("uReconcile/widen_longest_survivor", widen_longest_survivor_);
	sfile_.setValue("uReconcile/database_file", database_file_);
	sfile_.setValue("uReconcile/debug_log_to_file", log_to_file_);
	sfile_.setValue("uReconcile/log_file", log_file_);
	sfile_.sync();
}

qint64 Settings::getMinGapSec() const
{
	return (static_cast<qint64>(min_gap_min_) * 60);
}

double Settings::getDuplicateOverlapRatio() const
{
	return (duplicate_overlap_pct_ / 100.0);
}

double Settings::getHighSeverityRatio() const
{
	return (severity_high_pct_ / 100.0);
}

double Settings::getMediumSeverityRatio() const
{
	return (severity_medium_pct_ / 100.0);
}

bool Settings::isLabelContainmentEnabled() const
{
	return label_containment_;
}

qint64 Settings::getMergeableMaxGapSec() const
{
	return mergeable_max_gap_sec_;
}

qint64 Settings::getDurationToleranceSec() const
{
	return duration_tolerance_sec_;
}

bool Settings::isWidenLongestSurvivorEnabled() const
{
	return widen_longest_survivor_;
}

QString Settings::getDatabaseFile() const
{
	return database_file_;
}

bool Settings::logToFile() const
{
	return log_to_file_;
}

QString Settings::getLogFile() const
{
	return log_file_;
}

// Overrides for this run only, the settings file keeps its values
void Settings::setMinGapMinutes(const int minutes)
{
	min_gap_min_ = qBound(0, minutes, 24*60);
}

void Settings::setDatabaseFile(const QString& filename)
{
	if (!filename.trimmed().isEmpty())
		database_file_ = filename;
}
