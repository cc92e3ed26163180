/*
 *  hdhrctl
 *
 *  HTTPClient class
 *
 *  Copyright (C) 2014 Lars Schmohl
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

#include "HTTPClient.h"

#include <curl/curl.h>
#include <pthread.h>

#include "HDHR_Error.h"
#include "Log.h"

#define HTTP_USER_AGENT "hdhrctl/1.0"

static pthread_once_t curl_once = PTHREAD_ONCE_INIT;

static void curl_init( )
{
  curl_global_init( CURL_GLOBAL_DEFAULT );
}

static size_t write_callback( char *ptr, size_t size, size_t nmemb, void *userdata )
{
  std::string *body = (std::string *) userdata;
  body->append( ptr, size * nmemb );
  return size * nmemb;
}

HTTPResponse HTTPClient::Get( const std::string &url, int timeout_ms )
{
  pthread_once( &curl_once, curl_init );

  CURL *curl = curl_easy_init( );
  if( !curl )
    throw ConnectionError( "unable to initialize curl" );

  HTTPResponse response;
  curl_easy_setopt( curl, CURLOPT_URL, url.c_str( ));
  curl_easy_setopt( curl, CURLOPT_TIMEOUT_MS, (long) timeout_ms );
  curl_easy_setopt( curl, CURLOPT_CONNECTTIMEOUT_MS, (long) timeout_ms );
  curl_easy_setopt( curl, CURLOPT_NOSIGNAL, 1L );
  curl_easy_setopt( curl, CURLOPT_FOLLOWLOCATION, 1L );
  curl_easy_setopt( curl, CURLOPT_USERAGENT, HTTP_USER_AGENT );
  curl_easy_setopt( curl, CURLOPT_WRITEFUNCTION, write_callback );
  curl_easy_setopt( curl, CURLOPT_WRITEDATA, &response.body );

  LogDebug( "HTTP GET %s", url.c_str( ));
  CURLcode res = curl_easy_perform( curl );
  if( res != CURLE_OK )
  {
    std::string msg = url + ": " + curl_easy_strerror( res );
    curl_easy_cleanup( curl );
    throw ConnectionError( msg, res == CURLE_OPERATION_TIMEDOUT );
  }
  curl_easy_getinfo( curl, CURLINFO_RESPONSE_CODE, &response.status );
  curl_easy_cleanup( curl );
  LogDebug( "HTTP %ld %s (%zu bytes)", response.status, url.c_str( ), response.body.size( ));
  return response;
}

void HTTPFetch::Execute( )
{
  response = HTTPClient::Get( url, timeout_ms );
}
