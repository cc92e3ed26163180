/*
 *  hdhrctl
 *
 *  ConfigObject class
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

#include "ConfigObject.h"

#include "Utils.h"
#include "Log.h"

void ConfigBase::ReadConfig( const char *key, int &i, int def )
{
  if( settings->exists( key ))
  {
    if( !settings->lookupValue( key, i ))
    {
      LogWarn( "config: '%s' is not a number, using %d", key, def );
      i = def;
    }
  }
  else
  {
    settings->add( key, Setting::TypeInt ) = def;
    i = def;
  }
}

void ConfigBase::ReadConfig( const char *key, std::string &s, const std::string &def )
{
  if( settings->exists( key ))
  {
    if( !settings->lookupValue( key, s ))
    {
      LogWarn( "config: '%s' is not a string, using '%s'", key, def.c_str( ));
      s = def;
    }
  }
  else
  {
    settings->add( key, Setting::TypeString ) = def;
    s = def;
  }
}

void ConfigBase::WriteConfig( const char *key, int i )
{
  if( settings->exists( key ))
    (*settings)[key] = i;
  else
    settings->add( key, Setting::TypeInt ) = i;
}

void ConfigBase::WriteConfig( const char *key, const std::string &s )
{
  if( settings->exists( key ))
    (*settings)[key] = s;
  else
    settings->add( key, Setting::TypeString ) = s;
}

ConfigObject::ConfigObject( ) : ConfigBase( )
{
  settings = &config.getRoot( );
}

ConfigObject::~ConfigObject( )
{
}

bool ConfigObject::SetConfigFile( std::string configfile )
{
  configfile = Utils::Expand( configfile );
  configdir = Utils::DirName( configfile );
  Utils::EnsureSlash( configdir );
  if( !Utils::IsDir( configdir ))
  {
    if( !Utils::MkDir( configdir ))
    {
      LogError( "Cannot create configdir '%s'", configdir.c_str( ));
      return false;
    }
  }
  this->configfile = configfile;
  return true;
}

bool ConfigObject::WriteConfigFile( )
{
  try
  {
    config.writeFile( configfile.c_str( ));
  }
  catch( libconfig::FileIOException &e )
  {
    LogError( "Error writing config file: %s", configfile.c_str( ));
    return false;
  }
  return true;
}

bool ConfigObject::ReadConfigFile( )
{
  if( !Utils::IsFile( configfile ))
  {
    LogError( "not a config file '%s'", configfile.c_str( ));
    return false;
  }
  try
  {
    config.readFile( configfile.c_str( ));
  }
  catch( libconfig::ParseException &e )
  {
    LogError( "Error reading config file %s:%d: %s", configfile.c_str( ), e.getLine( ), e.getError( ));
    return false;
  }
  catch( libconfig::FileIOException &e )
  {
    LogError( "Error reading config file: %s", configfile.c_str( ));
    return false;
  }
  settings = &config.getRoot( );
  return true;
}
