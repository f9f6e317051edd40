/*==============================================================================
Fingerprint

The evaluation cache must recognise a point that has been evaluated before 
without comparing coordinate vectors element by element. Each point is 
therefore identified by a fingerprint: The IEEE-754 bit patterns of the 
coordinates are written in big-endian byte order, concatenated, and hashed 
with the SHA-1 digest [1]. Two coordinate vectors that are bit-identical, 
including the sign of zero and the payload of not-a-number values, will give 
the same fingerprint. There is no tolerance applied, so 0.1 + 0.2 and 0.3 are 
different points.

The digest is computed by the SHA-1 implementation provided with the Boost 
UUID library, and the byte order conversion uses the Boost Endian library.

References:

[1] D. Eastlake and P. Jones: "US Secure Hash Algorithm 1 (SHA1)", RFC 3174, 
    2001.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_FINGERPRINT
#define DIRECT_SEARCH_FINGERPRINT

#include <array>                              // The digest bytes
#include <cstddef>                            // Standard size type
#include <ostream>                            // Printing digests

#include "Variables.hpp"                      // Basic definitions
#include "Point.hpp"                          // Points

namespace DirectSearch
{

// The SHA-1 digest is 160 bits long

using Fingerprint = std::array< unsigned char, 20 >;

Fingerprint Identity( const Variables & Coordinates );
Fingerprint Identity( const Point & ThePoint );

// A hash functor is needed to use the fingerprint as the key of an unordered
// map. The bytes of the digest are combined by the Boost hash.

class FingerprintHash
{
public:

  std::size_t operator() ( const Fingerprint & Digest ) const;
};

// The fingerprint is printed as a hexadecimal string

std::ostream & operator<< ( std::ostream & Output, const Fingerprint & Digest );

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_FINGERPRINT
