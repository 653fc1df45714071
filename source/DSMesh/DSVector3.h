#pragma once

#include "DSMeshFwd.h"
#include "DSVector2.h"
#include <cmath>
#include <algorithm>
#include <type_traits>

namespace DS
{

/// three-dimensional vector
/// \ingroup VectorGroup
template <typename T>
struct Vector3
{
    using ValueType = T;
    static constexpr int elements = 3;

    T x, y, z;

    constexpr Vector3() noexcept : x( 0 ), y( 0 ), z( 0 ) { }
    constexpr Vector3( T x, T y, T z ) noexcept : x( x ), y( y ), z( z ) { }
    /// lifts planar point on the given height
    constexpr Vector3( const Vector2<T> & v, T z ) noexcept : x( v.x ), y( v.y ), z( z ) { }

    static constexpr Vector3 diagonal( T a ) noexcept { return Vector3( a, a, a ); }
    static constexpr Vector3 plusZ() noexcept { return Vector3( 0, 0, 1 ); }
    static constexpr Vector3 minusZ() noexcept { return Vector3( 0, 0, -1 ); }

    template <typename U> requires ( !std::is_same_v<T, U> )
    constexpr explicit Vector3( const Vector3<U> & v ) noexcept : x( T( v.x ) ), y( T( v.y ) ), z( T( v.z ) ) { }

    constexpr const T & operator []( int e ) const noexcept { return *( &x + e ); }
    constexpr       T & operator []( int e )       noexcept { return *( &x + e ); }

    T lengthSq() const { return x * x + y * y + z * z; }
    auto length() const
    {
        using std::sqrt;
        return sqrt( lengthSq() );
    }

    Vector3 normalized() const requires ( !std::is_integral_v<T> )
    {
        auto len = length();
        if ( len <= 0 )
            return {};
        return ( 1 / len ) * (*this);
    }

    [[nodiscard]] friend constexpr bool operator ==( const Vector3<T> & a, const Vector3<T> & b ) { return a.x == b.x && a.y == b.y && a.z == b.z; }
    [[nodiscard]] friend constexpr bool operator !=( const Vector3<T> & a, const Vector3<T> & b ) { return !( a == b ); }

    [[nodiscard]] friend constexpr Vector3<T> operator -( const Vector3<T> & a ) { return { -a.x, -a.y, -a.z }; }
    [[nodiscard]] friend constexpr Vector3<T> operator +( const Vector3<T> & a, const Vector3<T> & b ) { return { a.x + b.x, a.y + b.y, a.z + b.z }; }
    [[nodiscard]] friend constexpr Vector3<T> operator -( const Vector3<T> & a, const Vector3<T> & b ) { return { a.x - b.x, a.y - b.y, a.z - b.z }; }
    [[nodiscard]] friend constexpr Vector3<T> operator *(               T    a, const Vector3<T> & b ) { return { a * b.x, a * b.y, a * b.z }; }
    [[nodiscard]] friend constexpr Vector3<T> operator *( const Vector3<T> & b,               T    a ) { return { a * b.x, a * b.y, a * b.z }; }
    [[nodiscard]] friend constexpr Vector3<T> operator /(       Vector3<T>   b,               T    a ) { return b * ( 1 / a ); }

    friend constexpr Vector3<T> & operator +=( Vector3<T> & a, const Vector3<T> & b ) { a.x += b.x; a.y += b.y; a.z += b.z; return a; }
    friend constexpr Vector3<T> & operator -=( Vector3<T> & a, const Vector3<T> & b ) { a.x -= b.x; a.y -= b.y; a.z -= b.z; return a; }
    friend constexpr Vector3<T> & operator *=( Vector3<T> & a,               T    b ) { a.x *= b; a.y *= b; a.z *= b; return a; }
};

/// \related Vector3
/// \{

/// cross product
template <typename T>
inline Vector3<T> cross( const Vector3<T> & a, const Vector3<T> & b )
{
    return {
        a.y * b.z - a.z * b.y,
        a.z * b.x - a.x * b.z,
        a.x * b.y - a.y * b.x };
}

/// dot product
template <typename T>
inline T dot( const Vector3<T> & a, const Vector3<T> & b )
{
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

/// mixed product
template <typename T>
inline T mixed( const Vector3<T> & a, const Vector3<T> & b, const Vector3<T> & c )
{
    return dot( a, cross( b, c ) );
}

/// per component minimum
template <typename T>
inline Vector3<T> min( const Vector3<T> & a, const Vector3<T> & b )
{
    return { std::min( a.x, b.x ), std::min( a.y, b.y ), std::min( a.z, b.z ) };
}

/// per component maximum
template <typename T>
inline Vector3<T> max( const Vector3<T> & a, const Vector3<T> & b )
{
    return { std::max( a.x, b.x ), std::max( a.y, b.y ), std::max( a.z, b.z ) };
}

/// \}

} //namespace DS
