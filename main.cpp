#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QTextStream>

#include "settings.h"
#include "logger.h"
#include "activitystore.h"
#include "reconciler.h"
#include "reportjson.h"
#include "helpers.h"
#include "types.h"

namespace {

int fail(ReconcileError err, const QString& action)
{
	QTextStream(stderr) << "ureconcile: " << action << " failed: " << errorName(err) << "\n";
	return 2;
}

int usage(const QCommandLineParser& parser, const QString& message)
{
	QTextStream(stderr) << "ureconcile: " << message << "\n\n" << parser.helpText();
	return 1;
}

bool parseRef(const QString& text, ActivityRef* pRef)
{
	const QStringList parts = text.split(':');
	if (parts.size() != 2)
		return false;
	SourceType type;
	if (!parseSourceType(parts[0], &type))
		return false;
	bool ok = false;
	const qint64 id = parts[1].toLongLong(&ok);
	if (!ok || (id <= 0))
		return false;
	*pRef = ActivityRef(id, type);
	return true;
}

} // namespace

int main(int argc, char *argv[])
{
	QCoreApplication::setApplicationName("uReconcile");
	QCoreApplication application(argc, argv);

	QCommandLineParser parser;
	parser.setApplicationDescription("Finds gaps, overlaps and broken records in tracked activity time");
	parser.addHelpOption();
	QCommandLineOption settings_opt("settings", "Settings file.", "file", "user-settings.ini");
	QCommandLineOption db_opt("db", "SQLite database file, overrides the settings.", "file");
	QCommandLineOption from_opt("from", "Window start (ISO-8601).", "time");
	QCommandLineOption to_opt("to", "Window end (ISO-8601), exclusive.", "time");
	QCommandLineOption min_gap_opt("min-gap", "Smallest reported gap in minutes.", "minutes");
	QCommandLineOption merge_opt("merge", "Merge the conflict group with this index.", "index");
	QCommandLineOption strategy_opt("strategy", "longest, earliest, latest or manual.", "strategy", "longest");
	QCommandLineOption keep_opt("keep", "Survivor for the manual strategy, e.g. manual:12.", "source:id");
	QCommandLineOption fix_opt("fix", "Apply the cleanup fixes.");
	QCommandLineOption fill_opt("fill-gaps", "Fill every gap with a manual entry of this label.", "label");
	parser.addOptions({ settings_opt, db_opt, from_opt, to_opt, min_gap_opt, merge_opt, strategy_opt, keep_opt, fix_opt, fill_opt });
	parser.process(application);

	Settings settings(parser.value(settings_opt));
	if (settings.logToFile())
		Logger::SetFileName(settings.getLogFile());
	if (parser.isSet(db_opt))
		settings.setDatabaseFile(parser.value(db_opt));
	if (parser.isSet(min_gap_opt)) {
		bool ok = false;
		const int minutes = parser.value(min_gap_opt).toInt(&ok);
		if (!ok || (minutes < 0))
			return usage(parser, "--min-gap needs a non-negative number of minutes");
		settings.setMinGapMinutes(minutes);
	}

	const QDateTime from = convIsoStrToDateTime(parser.value(from_opt));
	const QDateTime to = convIsoStrToDateTime(parser.value(to_opt));
	if (!from.isValid() || !to.isValid())
		return usage(parser, "--from and --to need ISO-8601 timestamps");

	MergeStrategy strategy = MergeStrategy::Longest;
	ActivityRef keep;
	int merge_index = -1;
	if (parser.isSet(merge_opt)) {
		bool ok = false;
		merge_index = parser.value(merge_opt).toInt(&ok);
		if (!ok || (merge_index < 0))
			return usage(parser, "--merge needs a conflict group index");
		if (!parseMergeStrategy(parser.value(strategy_opt), &strategy))
			return usage(parser, "unknown merge strategy " + parser.value(strategy_opt));
		if ((strategy == MergeStrategy::ManualSelection) && !parseRef(parser.value(keep_opt), &keep))
			return usage(parser, "the manual strategy needs --keep SOURCE:ID");
	}

	ActivityStore store(settings);
	Reconciler reconciler(settings, store);

	ReconcileReport report;
	ReconcileError err = reconciler.runPass(from, to, &report);
	if (err != ReconcileError::None)
		return fail(err, "analysis");

	QJsonObject output;
	output["report"] = reportToJson(report);
	bool changed = false;

	// Each step works on a fresh pass so it never acts on records an earlier step removed
	if (merge_index >= 0) {
		MergeDecision decision;
		err = reconciler.mergeGroup(report, merge_index, strategy, keep, &decision);
		if (err != ReconcileError::None)
			return fail(err, "merge");
		output["merge"] = mergeDecisionToJson(decision);
		changed = true;
	}

	if (parser.isSet(fix_opt)) {
		if (changed && ((err = reconciler.runPass(from, to, &report)) != ReconcileError::None))
			return fail(err, "analysis");
		err = reconciler.applyFixes(report.defects);
		if (err != ReconcileError::None)
			return fail(err, "cleanup");
		output["fixes_applied"] = static_cast<int>(report.defects.size());
		changed = true;
	}

	if (parser.isSet(fill_opt)) {
		if (changed && ((err = reconciler.runPass(from, to, &report)) != ReconcileError::None))
			return fail(err, "analysis");
		std::deque<qint64> ids;
		err = reconciler.fillGaps(report.gaps, parser.value(fill_opt), &ids);
		if (err != ReconcileError::None)
			return fail(err, "gap filling");
		QJsonArray filled;
		for (const auto id : ids)
			filled.append(id);
		output["filled_gaps"] = filled;
		changed = true;
	}

	if (changed) {
		if ((err = reconciler.runPass(from, to, &report)) != ReconcileError::None)
			return fail(err, "analysis");
		output["report_after"] = reportToJson(report);
	}

	QTextStream(stdout) << QJsonDocument(output).toJson(QJsonDocument::Indented);
	return 0;
}
