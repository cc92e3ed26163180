/*
 *  hdhrctl
 *
 *  HDHR_Packet class
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

#ifndef _HDHR_Packet_
#define _HDHR_Packet_

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include <map>

#include <libhdhomerun/hdhomerun.h>

#define HDHR_DISCOVER_UDP_PORT HDHOMERUN_DISCOVER_UDP_PORT
#define HDHR_CONTROL_TCP_PORT  HDHOMERUN_CONTROL_TCP_PORT

#define HDHR_DEVICE_TYPE_WILDCARD HDHOMERUN_DEVICE_TYPE_WILDCARD
#define HDHR_DEVICE_TYPE_TUNER    HDHOMERUN_DEVICE_TYPE_TUNER
#define HDHR_DEVICE_TYPE_STORAGE  0x00000005
#define HDHR_DEVICE_ID_WILDCARD   HDHOMERUN_DEVICE_ID_WILDCARD

#define HDHR_FRAME_HEADER_SIZE 4
#define HDHR_FRAME_CRC_SIZE    4
#define HDHR_MAX_PACKET_SIZE   HDHOMERUN_MAX_PACKET_SIZE
#define HDHR_MAX_TAG_LENGTH    0x7FFF

enum HDHR_PacketType
{
  HDHR_TYPE_DISCOVER_REQ = HDHOMERUN_TYPE_DISCOVER_REQ,
  HDHR_TYPE_DISCOVER_RPY = HDHOMERUN_TYPE_DISCOVER_RPY,
  HDHR_TYPE_GETSET_REQ   = HDHOMERUN_TYPE_GETSET_REQ,
  HDHR_TYPE_GETSET_RPY   = HDHOMERUN_TYPE_GETSET_RPY,
  HDHR_TYPE_UPGRADE_REQ  = HDHOMERUN_TYPE_UPGRADE_REQ,
  HDHR_TYPE_UPGRADE_RPY  = HDHOMERUN_TYPE_UPGRADE_RPY,
};

enum HDHR_Tag
{
  HDHR_TAG_DEVICE_TYPE     = HDHOMERUN_TAG_DEVICE_TYPE,
  HDHR_TAG_DEVICE_ID       = HDHOMERUN_TAG_DEVICE_ID,
  HDHR_TAG_GETSET_NAME     = HDHOMERUN_TAG_GETSET_NAME,
  HDHR_TAG_GETSET_VALUE    = HDHOMERUN_TAG_GETSET_VALUE,
  HDHR_TAG_ERROR_MESSAGE   = HDHOMERUN_TAG_ERROR_MESSAGE,
  HDHR_TAG_TUNER_COUNT     = HDHOMERUN_TAG_TUNER_COUNT,
  HDHR_TAG_GETSET_LOCKKEY  = HDHOMERUN_TAG_GETSET_LOCKKEY,
  HDHR_TAG_LINEUP_URL      = 0x27,
  HDHR_TAG_STORAGE_URL     = 0x28,
  HDHR_TAG_BASE_URL        = 0x2A,
  HDHR_TAG_DEVICE_AUTH_STR = 0x2B,
};

typedef std::vector<uint8_t> ByteBuffer;

/*
 * one frame of the HDHomeRun discovery / control protocol:
 *
 *   type:u16be | length:u16be | { tag:u8 varlen value }* | crc32:u32le
 *
 * framing and crc are done by libhdhomerun's hdhomerun_pkt functions
 */
class HDHR_Packet
{
  public:
    typedef std::vector<std::pair<uint8_t, ByteBuffer> > TagList;

    HDHR_Packet( uint16_t type = 0 );
    virtual ~HDHR_Packet( );

    uint16_t GetType( ) const { return type; }
    uint16_t GetLength( ) const { return length; }

    void AddTag( uint8_t tag, const ByteBuffer &value );
    void AddTagU8( uint8_t tag, uint8_t value );
    void AddTagU32( uint8_t tag, uint32_t value );
    void AddTagString( uint8_t tag, const std::string &value );

    bool HasTag( uint8_t tag ) const;
    bool GetBytes( uint8_t tag, ByteBuffer &value ) const;
    bool GetString( uint8_t tag, std::string &value ) const;
    bool GetU8( uint8_t tag, uint8_t &value ) const;
    bool GetU32( uint8_t tag, uint32_t &value ) const;
    const std::map<uint8_t, ByteBuffer> &GetTags( ) const { return tags; }

    ByteBuffer Build( ) const;

    static ByteBuffer Build( uint16_t type, const TagList &payload );
    static HDHR_Packet Parse( const ByteBuffer &raw, uint16_t expected_type );
    static HDHR_Packet Parse( const uint8_t *raw, size_t size, uint16_t expected_type );

    // total frame size announced by a 4 byte header
    static size_t FrameSize( const uint8_t *header );

    static HDHR_Packet DiscoverRequest( uint32_t device_type, uint32_t device_id );
    static HDHR_Packet GetsetRequest( const std::string &name );
    static HDHR_Packet GetsetRequest( const std::string &name, const std::string &value );

  private:
    uint16_t type;
    uint16_t length;
    TagList payload;
    std::map<uint8_t, ByteBuffer> tags;
};

#endif
