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

#ifndef _HTTPClient_
#define _HTTPClient_

#include <string>

#include "Thread.h"

struct HTTPResponse
{
  HTTPResponse( ) : status(0) { }
  long status;
  std::string body;

  bool OK( ) const { return status >= 200 && status < 300; }
};

namespace HTTPClient
{
  // blocking GET, throws ConnectionError if no response was received
  HTTPResponse Get( const std::string &url, int timeout_ms );
}

/* a GET running on its own thread, fails only if no response was received */
class HTTPFetch : public Job
{
  public:
    HTTPFetch( const std::string &url, int timeout_ms ) : url(url), timeout_ms(timeout_ms) { }

    const std::string &GetURL( ) const { return url; }
    const HTTPResponse &GetResponse( ) const { return response; }

  protected:
    virtual void Execute( );

  private:
    std::string url;
    int timeout_ms;
    HTTPResponse response;
};

#endif
