/*==============================================================================
Fingerprint

Implementation of the point digest. The Boost SHA-1 implementation delivers 
the digest as a fixed size array whose element type has changed between Boost 
versions: Older versions give five 32 bit words in native byte order and newer
versions give the 20 bytes of the digest. The words are written in big-endian
byte order so that the fingerprint is the standard SHA-1 byte sequence in both
cases.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <cstdint>                            // Fixed width integers
#include <cstring>                            // Copying bit patterns
#include <iomanip>                            // Hexadecimal printing
#include <type_traits>                        // Digest element type
#include <vector>                             // Byte buffer

#include <boost/endian/conversion.hpp>        // Big endian byte order
#include <boost/uuid/detail/sha1.hpp>         // The SHA-1 digest
#include <boost/container_hash/hash.hpp>      // Hash combination

#include "Fingerprint.hpp"

namespace DirectSearch
{

using DigestType = boost::uuids::detail::sha1::digest_type;
using DigestWord = std::remove_extent_t< DigestType >;

static_assert( ( sizeof( DigestWord ) == 1 ) || ( sizeof( DigestWord ) == 4 ),
               "The SHA-1 digest must be given as bytes or 32 bit words" );

static_assert( sizeof( DigestType ) == std::tuple_size< Fingerprint >::value,
               "The SHA-1 digest must be 160 bits" );

static_assert( sizeof( VariableType ) == sizeof( std::uint64_t ),
               "The coordinates must be 64 bit IEEE-754 values" );

Fingerprint Identity( const Variables & Coordinates )
{
  std::vector< unsigned char > 
  Bytes( Coordinates.size() * sizeof( std::uint64_t ) );

  for ( Dimension i = 0; i < Coordinates.size(); i++ )
  {
    std::uint64_t BitPattern;

    std::memcpy( &BitPattern, &Coordinates[ i ], sizeof( BitPattern ) );
    BitPattern = boost::endian::native_to_big( BitPattern );
    std::memcpy( Bytes.data() + i * sizeof( BitPattern ), &BitPattern, 
                 sizeof( BitPattern ) );
  }

  boost::uuids::detail::sha1 Hasher;
  DigestType                 Digest;

  Hasher.process_bytes( Bytes.data(), Bytes.size() );
  Hasher.get_digest( Digest );

  Fingerprint Result;

  if constexpr ( sizeof( DigestWord ) == 1 )
    std::memcpy( Result.data(), &Digest, Result.size() );
  else
    for ( std::size_t i = 0; i < std::extent< DigestType >::value; i++ )
    {
      std::uint32_t Word = 
                    boost::endian::native_to_big( std::uint32_t( Digest[ i ] ) );

      std::memcpy( Result.data() + i * sizeof( Word ), &Word, sizeof( Word ) );
    }

  return Result;
}

Fingerprint Identity( const Point & ThePoint )
{
  return Identity( ThePoint.Position() );
}

std::size_t FingerprintHash::operator() ( const Fingerprint & Digest ) const
{
  return boost::hash_range( Digest.begin(), Digest.end() );
}

std::ostream & operator<< ( std::ostream & Output, const Fingerprint & Digest )
{
  std::ios_base::fmtflags Flags( Output.flags() );

  Output << std::hex << std::setfill('0');

  for ( unsigned char Byte : Digest )
    Output << std::setw(2) << static_cast< unsigned int >( Byte );

  Output.flags( Flags );
  return Output;
}

}      // End name space DirectSearch
