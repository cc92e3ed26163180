/*
 *  hdhrctl
 *
 *  Thread class
 *
 *  Copyright (C) 2013 André Roth
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

#include "Thread.h"

#include <exception>
#include <limits.h> // PTHREAD_STACK_MIN

#include "Log.h"

Mutex::Mutex( )
{
  pthread_mutex_init( &mutex, NULL );
}

Mutex::~Mutex( )
{
  pthread_mutex_destroy( &mutex );
}

void Mutex::Lock( ) const
{
  pthread_mutex_lock( &mutex );
}

void Mutex::Unlock( ) const
{
  pthread_mutex_unlock( &mutex );
}

Thread::Thread( ssize_t stacksize ) : Mutex( ), stacksize(stacksize), started(false)
{
  if( this->stacksize < PTHREAD_STACK_MIN )
    this->stacksize = PTHREAD_STACK_MIN;
}

Thread::~Thread( )
{
  JoinThread( );
}

void Thread::JoinThread( )
{
  if( started )
  {
    pthread_join( thread, NULL );
    started = false;
  }
}

bool Thread::StartThread( )
{
  int ret;
  pthread_attr_t attr;
  if( started )
  {
    LogError( "Thread: already running" );
    return false;
  }
  pthread_attr_init( &attr );
  if(( ret = pthread_attr_setstacksize( &attr, stacksize )) != 0 )
  {
    LogError( "Thread: error setting stack size: %d", ret );
    pthread_attr_destroy( &attr );
    return false;
  }
  if(( ret = pthread_create( &thread, &attr, run, (void *) this )) != 0 )
  {
    LogError( "Thread: error creating thread: %d", ret );
    pthread_attr_destroy( &attr );
    return false;
  }
  pthread_attr_destroy( &attr );
  started = true;
  return true;
}

void *Thread::run( void *ptr )
{
  Thread *t = (Thread *) ptr;
  t->Run( );
  return NULL;
}


Job::Job( ) : Thread( ), failed(false)
{
}

Job::~Job( )
{
  JoinThread( );
}

bool Job::Start( )
{
  failed = false;
  error.clear( );
  if( !StartThread( ))
  {
    failed = true;
    error = "unable to start thread";
    return false;
  }
  return true;
}

void Job::Wait( )
{
  JoinThread( );
}

void Job::Run( )
{
  try
  {
    Execute( );
  }
  catch( std::exception &e )
  {
    failed = true;
    error = e.what( );
  }
}

bool Job::RunAll( const std::vector<Job *> &jobs )
{
  bool ok = true;
  for( size_t i = 0; i < jobs.size( ); i++ )
    jobs[i]->Start( );
  for( size_t i = 0; i < jobs.size( ); i++ )
  {
    jobs[i]->Wait( );
    if( jobs[i]->Failed( ))
      ok = false;
  }
  return ok;
}
