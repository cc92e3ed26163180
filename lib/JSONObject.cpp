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

#include "JSONObject.h"

#include <stdio.h> // snprintf

void json_object_string_add( json_object *j, const char *name, const std::string &value )
{
  json_object_object_add( j, name, json_object_new_string( value.c_str( )));
}

bool json_object_get_string_value( json_object *j, const char *name, std::string &value )
{
  json_object *v = NULL;
  if( !json_object_object_get_ex( j, name, &v ) || !json_object_is_type( v, json_type_string ))
    return false;
  value = json_object_get_string( v );
  return true;
}

bool json_object_get_int_value( json_object *j, const char *name, int &value )
{
  json_object *v = NULL;
  if( !json_object_object_get_ex( j, name, &v ))
    return false;
  switch( json_object_get_type( v ))
  {
    case json_type_int:
    case json_type_boolean:
    case json_type_double:
      value = json_object_get_int( v );
      return true;
    default:
      return false;
  }
}

bool json_object_scalar_to_string( json_object *j, std::string &value )
{
  char buf[32];
  switch( json_object_get_type( j ))
  {
    case json_type_string:
      value = json_object_get_string( j );
      return true;
    case json_type_int:
      snprintf( buf, sizeof( buf ), "%lld", (long long) json_object_get_int64( j ));
      value = buf;
      return true;
    case json_type_boolean:
      value = json_object_get_boolean( j ) ? "1" : "0";
      return true;
    case json_type_double:
      snprintf( buf, sizeof( buf ), "%g", json_object_get_double( j ));
      value = buf;
      return true;
    default:
      return false;
  }
}

std::string json_object_to_pretty_string( json_object *j )
{
  return json_object_to_json_string_ext( j, JSON_C_TO_STRING_PRETTY );
}
