#include "logger.h"
#include <QDateTime>
#include <QTextStream>

QString Logger::filename_ = "ureconcile.log";

Logger::Logger()
{
	logfile_ = new QFile();
	logfile_->setFileName(filename_);
	if (!logfile_->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
		delete logfile_;
		logfile_ = nullptr;
		return;
	}
	log("uReconcile Startup");
}

void Logger::SetFileName(const QString &filename)
{
	if (!filename.trimmed().isEmpty())
		filename_ = filename.trimmed();
}

void Logger::Log(const QString &text)
{
	static Logger L;
	L.log(text);
}

void Logger::log(const QString &text)
{
	if (logfile_ == nullptr)
		return;
	const QString msg = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz: ") + text + "\n";
	QTextStream out(logfile_);
	out.setCodec("UTF-8");
	out << msg;
}

Logger::~Logger()
{
	log("uReconcile Shutdown");
	if (logfile_ != nullptr) {
		logfile_->close();
		delete logfile_;
	}
}
