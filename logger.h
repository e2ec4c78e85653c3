#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QFile>

class Logger
{
	QFile *logfile_;
	static QString filename_;

	Logger();
	void log(const QString & text);

public:
	// Must be called before the first Log(), the file is opened once
	static void SetFileName(const QString & filename);
	static void Log(const QString & text);
	~Logger();
};

#endif // LOGGER_H
