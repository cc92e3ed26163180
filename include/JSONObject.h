/*
 *  hdhrctl
 *
 *  JSONObject class
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

#ifndef _JSONObject_
#define _JSONObject_

#include <string>
#include <json-c/json.h>

class JSONObject
{
  public:
    virtual ~JSONObject( ) { }
    virtual void json( json_object *j ) const = 0;
};

void json_object_string_add( json_object *j, const char *name, const std::string &value );

// lookups on a parsed object, false if the key is missing or of another type
bool json_object_get_string_value( json_object *j, const char *name, std::string &value );
bool json_object_get_int_value( json_object *j, const char *name, int &value );

// renders a scalar as a string, ints as decimal, false for objects, arrays and null
bool json_object_scalar_to_string( json_object *j, std::string &value );

std::string json_object_to_pretty_string( json_object *j );

#endif
