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

#ifndef _ConfigObject_
#define _ConfigObject_

#include <libconfig.h++>
using namespace libconfig;
#include <string>

class ConfigBase
{
  public:
    ConfigBase( ) : settings(NULL) { };
    virtual ~ConfigBase( ) { }

    // missing keys take the default and are added to the settings
    void     ReadConfig  ( const char *key, int &i, int def = 0 );
    void     ReadConfig  ( const char *key, std::string &s, const std::string &def = "" );
    void     WriteConfig ( const char *key, int i );
    void     WriteConfig ( const char *key, const std::string &s );

  protected:
    Setting *settings;
};

class ConfigObject : public ConfigBase
{
  public:
    ConfigObject( );
    virtual ~ConfigObject( );

    virtual bool SaveConfig( ) { return true; }
    virtual bool LoadConfig( ) { return true; }

    std::string GetConfigDir( )  { return configdir; }
    std::string GetConfigFile( ) { return configfile; }
    bool SetConfigFile( std::string configfile );
    bool WriteConfigFile( );
    bool ReadConfigFile( );

  private:
    std::string configfile;
    std::string configdir;
    Config config;
};

#endif
