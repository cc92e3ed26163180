/*
 *  hdhrctl
 *
 *  Utils
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

#include "Utils.h"

#include <wordexp.h>
#include <sys/stat.h>
#include <libgen.h>  // dirname
#include <string.h>  // strdup, strchr
#include <stdlib.h>  // free, strtol
#include <errno.h>
#include <ctype.h>   // toupper, isspace

#include "Log.h"

std::string Utils::Expand( const std::string &path )
{
  wordexp_t p;
  std::string ex = path;
  size_t pos = 0;
  while( true )
  {
    pos = ex.find( ' ', pos );
    if( pos == std::string::npos )
      break;
    ex.insert( pos, "\\" );
    pos += 2; // skip backslash and space
  }
  if( wordexp( ex.c_str( ), &p, 0 ) == 0 )
  {
    if( p.we_wordc > 0 )
      ex = p.we_wordv[0];
    wordfree( &p );
  }
  return ex;
}

std::string Utils::DirName( std::string path )
{
  char *tmp = strdup( path.c_str( ));
  char *dir = dirname( tmp );
  if( !dir )
  {
    free( tmp );
    return "";
  }
  std::string r( dir );
  free( tmp );
  return r;
}

bool Utils::IsDir( std::string path )
{
  struct stat sb;
  if( stat( path.c_str( ), &sb ) == -1 )
    return false;
  return S_ISDIR( sb.st_mode );
}

bool Utils::IsFile( std::string path )
{
  struct stat sb;
  if( stat( path.c_str( ), &sb ) == -1 )
    return false;
  return S_ISREG( sb.st_mode );
}

bool Utils::MkDir( std::string path )
{
  return mkdir( path.c_str( ), 0755 ) == 0;
}

void Utils::EnsureSlash( std::string &dir )
{
  if( dir.empty( ) || dir[dir.length( ) - 1] != '/' )
    dir += "/";
}

void Utils::ToUpper( const std::string &string, std::string &upper )
{
  upper = string;
  for( size_t i = 0; i < upper.length( ); i++ )
    upper[i] = toupper((unsigned char) upper[i] );
}

std::string Utils::Trim( const std::string &string )
{
  size_t start = 0, end = string.length( );
  while( start < end && isspace((unsigned char) string[start] ))
    start++;
  while( end > start && isspace((unsigned char) string[end - 1] ))
    end--;
  return string.substr( start, end - start );
}

bool Utils::StartsWith( const std::string &string, const std::string &prefix )
{
  return string.compare( 0, prefix.length( ), prefix ) == 0;
}

bool Utils::ParseInt( const std::string &string, int &value )
{
  if( string.empty( ))
    return false;
  char *end = NULL;
  errno = 0;
  long l = strtol( string.c_str( ), &end, 10 );
  if( errno != 0 || *end != '\0' || l > INT32_MAX || l < INT32_MIN )
    return false;
  value = (int) l;
  return true;
}

int Utils::Tokenize( const std::string &string, const char delims[], std::vector<std::string> &tokens, int count )
{
  size_t len = string.length( );
  size_t i = 0;
  tokens.clear( );
  while( i < len )
  {
    // eat delimiters
    while( i < len && strchr( delims, string[i] ))
      i++;
    if( i == len )
      break;

    if( count > 0 && (int) tokens.size( ) == count - 1 )
    {
      tokens.push_back( string.substr( i ));
      break;
    }

    size_t j = i;

    // eat non-delimiters
    while( i < len && !strchr( delims, string[i] ))
      i++;

    tokens.push_back( string.substr( j, i - j ));
  }
  return tokens.size( );
}

std::string Utils::URLHost( const std::string &url )
{
  size_t start = url.find( "://" );
  start = ( start == std::string::npos ) ? 0 : start + 3;
  size_t end = url.find_first_of( ":/?#", start );
  if( end == std::string::npos )
    end = url.length( );
  return url.substr( start, end - start );
}

std::string Utils::URLWithPath( const std::string &url, const std::string &path )
{
  size_t start = url.find( "://" );
  start = ( start == std::string::npos ) ? 0 : start + 3;
  size_t end = url.find_first_of( "/?#", start );
  std::string base = url.substr( 0, end );
  if( path.empty( ) || path[0] != '/' )
    base += "/";
  return base + path;
}
