#pragma once

#include "DSMeshFwd.h"
#include <cmath>
#include <algorithm>
#include <type_traits>
#include <utility>

namespace DS
{

/// \defgroup VectorGroup Vector
/// \ingroup MathGroup

/// two-dimensional vector
/// \ingroup VectorGroup
template <typename T>
struct Vector2
{
    using ValueType = T;
    static constexpr int elements = 2;

    T x, y;

    constexpr Vector2() noexcept : x( 0 ), y( 0 ) { }
    constexpr Vector2( T x, T y ) noexcept : x( x ), y( y ) { }

    static constexpr Vector2 diagonal( T a ) noexcept { return Vector2( a, a ); }
    static constexpr Vector2 plusX() noexcept { return Vector2( 1, 0 ); }
    static constexpr Vector2 plusY() noexcept { return Vector2( 0, 1 ); }

    template <typename U> requires ( !std::is_same_v<T, U> )
    constexpr explicit Vector2( const Vector2<U> & v ) noexcept : x( T( v.x ) ), y( T( v.y ) ) { }

    constexpr const T & operator []( int e ) const noexcept { return *( &x + e ); }
    constexpr       T & operator []( int e )       noexcept { return *( &x + e ); }

    T lengthSq() const { return x * x + y * y; }
    auto length() const
    {
        using std::sqrt;
        return sqrt( lengthSq() );
    }

    Vector2 normalized() const requires ( !std::is_integral_v<T> )
    {
        auto len = length();
        if ( len <= 0 )
            return {};
        return ( 1 / len ) * (*this);
    }

    /// returns same length vector orthogonal to this (rotated 90 degrees counter-clockwise)
    constexpr Vector2 perpendicular() const { return Vector2{ -y, x }; }

    [[nodiscard]] friend constexpr bool operator ==( const Vector2<T> & a, const Vector2<T> & b ) { return a.x == b.x && a.y == b.y; }
    [[nodiscard]] friend constexpr bool operator !=( const Vector2<T> & a, const Vector2<T> & b ) { return !( a == b ); }

    [[nodiscard]] friend constexpr Vector2<T> operator -( const Vector2<T> & a ) { return { -a.x, -a.y }; }
    [[nodiscard]] friend constexpr Vector2<T> operator +( const Vector2<T> & a, const Vector2<T> & b ) { return { a.x + b.x, a.y + b.y }; }
    [[nodiscard]] friend constexpr Vector2<T> operator -( const Vector2<T> & a, const Vector2<T> & b ) { return { a.x - b.x, a.y - b.y }; }
    [[nodiscard]] friend constexpr Vector2<T> operator *(               T    a, const Vector2<T> & b ) { return { a * b.x, a * b.y }; }
    [[nodiscard]] friend constexpr Vector2<T> operator *( const Vector2<T> & b,               T    a ) { return { a * b.x, a * b.y }; }
    [[nodiscard]] friend constexpr Vector2<T> operator /(       Vector2<T>   b,               T    a )
    {
        if constexpr ( std::is_integral_v<T> )
            return { b.x / a, b.y / a };
        else
            return b * ( 1 / a );
    }

    friend constexpr Vector2<T> & operator +=( Vector2<T> & a, const Vector2<T> & b ) { a.x += b.x; a.y += b.y; return a; }
    friend constexpr Vector2<T> & operator -=( Vector2<T> & a, const Vector2<T> & b ) { a.x -= b.x; a.y -= b.y; return a; }
    friend constexpr Vector2<T> & operator *=( Vector2<T> & a,               T    b ) { a.x *= b; a.y *= b; return a; }
    friend constexpr Vector2<T> & operator /=( Vector2<T> & a,               T    b )
    {
        if constexpr ( std::is_integral_v<T> )
            { a.x /= b; a.y /= b; return a; }
        else
            return a *= ( 1 / b );
    }
};

/// \related Vector2
/// \{

/// squared distance between two points, which is faster to compute than just distance
template <typename T>
inline T distanceSq( const Vector2<T> & a, const Vector2<T> & b )
{
    return ( a - b ).lengthSq();
}

/// distance between two points, better use distanceSq for higher performance
template <typename T>
inline T distance( const Vector2<T> & a, const Vector2<T> & b )
{
    return ( a - b ).length();
}

/// cross product
template <typename T>
inline T cross( const Vector2<T> & a, const Vector2<T> & b )
{
    return a.x * b.y - a.y * b.x;
}

/// dot product
template <typename T>
inline T dot( const Vector2<T> & a, const Vector2<T> & b )
{
    return a.x * b.x + a.y * b.y;
}

/// per component minimum
template <typename T>
inline Vector2<T> min( const Vector2<T> & a, const Vector2<T> & b )
{
    return { std::min( a.x, b.x ), std::min( a.y, b.y ) };
}

/// per component maximum
template <typename T>
inline Vector2<T> max( const Vector2<T> & a, const Vector2<T> & b )
{
    return { std::max( a.x, b.x ), std::max( a.y, b.y ) };
}

/// \}

} //namespace DS
