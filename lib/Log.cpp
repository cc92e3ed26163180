/*
 *  hdhrctl
 *
 *  Logging
 *
 *  Copyright (C) 2012 André Roth
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Log.h"

#include <stdarg.h>
#include <unistd.h> // isatty
#include <pthread.h>

Logger *Logger::logger = NULL;
int Logger::threshold = LOG_INFO;

static pthread_mutex_t instance_mutex = PTHREAD_MUTEX_INITIALIZER;

Logger *Logger::Instance( )
{
  pthread_mutex_lock( &instance_mutex );
  if( !logger )
    new Logger( );
  Logger *l = logger;
  pthread_mutex_unlock( &instance_mutex );
  return l;
}

Logger::Logger( )
{
  if( logger )
    delete logger;
  logger = this;
}

Logger::~Logger( )
{
  if( logger == this )
    logger = NULL;
}

#define LOG_COLOROFF 8
void Logger::Log( int level, const char *log )
{
  const char *color = "", *term = "";
  const struct loglevel loglevels[9] = {
    {"EMERG   ", "\033[31m", stderr },
    {"ALERT   ", "\033[31m", stderr },
    {"CRITICAL", "\033[31m", stderr },
    {"ERROR   ", "\033[31m", stderr },
    {"WARNING ", "\033[33m", stderr },
    {"NOTICE  ", "\033[36m", stderr },
    {"INFO    ", "\033[36m", stderr },
    {"DEBUG   ", "\033[32m", stderr },
    {"",         "\033[0m",  stderr },
  };
  if( level < 0 || level > LOG_DEBUG )
    level = LOG_INFO;
  FILE *io = loglevels[level].io;
  if( isatty( fileno( io )))
  {
    color = loglevels[level].color;
    term  = loglevels[LOG_COLOROFF].color;
  }
  fprintf( io, "%s%s %s%s\n", color, loglevels[level].name, log, term );
}

LoggerSyslog::LoggerSyslog( const char *ident )
{
  openlog( ident, LOG_NDELAY, LOG_DAEMON );
}

LoggerSyslog::~LoggerSyslog( )
{
  closelog( );
}

void LoggerSyslog::Log( int level, const char *log )
{
  syslog( level, "%s", log );
}

static void vlog( int level, const char *fmt, va_list ap )
{
  if( level > Logger::GetLevel( ))
    return;
  char msg[512];
  vsnprintf( msg, sizeof( msg ), fmt, ap );
  Logger::Instance( )->Log( level, msg );
}

void HDHR_Log( int level, const char *fmt, ... )
{
  va_list ap;
  va_start( ap, fmt );
  vlog( level, fmt, ap );
  va_end( ap );
}

void Log( const char *fmt, ... )
{
  va_list ap;
  va_start( ap, fmt );
  vlog( LOG_NOTICE, fmt, ap );
  va_end( ap );
}

void LogInfo( const char *fmt, ... )
{
  va_list ap;
  va_start( ap, fmt );
  vlog( LOG_INFO, fmt, ap );
  va_end( ap );
}

void LogWarn( const char *fmt, ... )
{
  va_list ap;
  va_start( ap, fmt );
  vlog( LOG_WARNING, fmt, ap );
  va_end( ap );
}

void LogError( const char *fmt, ... )
{
  va_list ap;
  va_start( ap, fmt );
  vlog( LOG_ERR, fmt, ap );
  va_end( ap );
}

void LogDebug( const char *fmt, ... )
{
  va_list ap;
  va_start( ap, fmt );
  vlog( LOG_DEBUG, fmt, ap );
  va_end( ap );
}
