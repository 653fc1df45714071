#pragma once

#include "DSMeshFwd.h"
#include "DSVector2.h"
#include "DSVector3.h"
#include <cassert>
#include <limits>

namespace DS
{

/// \defgroup BoxGroup Box
/// \ingroup MathGroup
/// \{

/// Box given by its min- and max- corners
template <typename V>
struct Box
{
public:
    using T = typename V::ValueType;
    static constexpr int elements = V::elements;

    V min, max;

    /// create invalid box by default
    Box() : min{ V::diagonal( std::numeric_limits<T>::max() ) }, max{ V::diagonal( std::numeric_limits<T>::lowest() ) } { }
    Box( const V& min, const V& max ) : min{ min }, max{ max } { }

    template <typename U>
    explicit Box( const Box<U> & a ) : min{ a.min }, max{ a.max } { }

    /// true if the box contains at least one point
    bool valid() const
    {
        for ( int i = 0; i < elements; ++i )
            if ( min[i] > max[i] )
                return false;
        return true;
    }

    /// computes center of the box
    V center() const { assert( valid() ); return ( min + max ) / T(2); }

    /// computes size of the box in all dimensions
    V size() const { assert( valid() ); return max - min; }

    /// minimally increases the box to include given point
    void include( const V & pt )
    {
        for ( int i = 0; i < elements; ++i )
        {
            if ( pt[i] < min[i] ) min[i] = pt[i];
            if ( pt[i] > max[i] ) max[i] = pt[i];
        }
    }

    /// minimally increases the box to include another box
    void include( const Box & b )
    {
        if ( !b.valid() )
            return;
        include( b.min );
        include( b.max );
    }

    /// checks whether given point is inside (including the surface) of this box
    bool contains( const V & pt ) const
    {
        for ( int i = 0; i < elements; ++i )
            if ( min[i] > pt[i] || pt[i] > max[i] )
                return false;
        return true;
    }

    /// checks whether this box and given one have at least one common point
    bool intersects( const Box & b ) const
    {
        for ( int i = 0; i < elements; ++i )
        {
            if ( b.max[i] < min[i] || b.min[i] > max[i] )
                return false;
        }
        return true;
    }

    /// decreases min and increases max on given value
    Box expanded( const V & expansion ) const
    {
        assert( valid() );
        return Box( min - expansion, max + expansion );
    }
};

/// \}

} //namespace DS
