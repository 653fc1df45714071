#include "DS2DContoursTriangulation.h"
#include "DSContour.h"
#include "DSConstants.h"
#include "DSTimer.h"
#include "DSPch/DSSpdlog.h"
#include "DSPch/DSTBB.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>

namespace DS
{

std::vector<int> ContourTree::children( int c ) const
{
    std::vector<int> res;
    for ( int i = 0; i < int( parent.size() ); ++i )
        if ( parent[i] == c )
            res.push_back( i );
    return res;
}

double ContourTree::materialArea() const
{
    double res = 0;
    for ( const auto& c : contours )
        res += calcOrientedArea<double>( c );
    return res;
}

namespace PlanarTriangulation
{

namespace
{

int sign( double x )
{
    return x > 0 ? 1 : ( x < 0 ? -1 : 0 );
}

// p is known to be collinear with segment ab
bool onSegment( const Vector2d& a, const Vector2d& b, const Vector2d& p )
{
    return std::min( a.x, b.x ) <= p.x && p.x <= std::max( a.x, b.x ) &&
           std::min( a.y, b.y ) <= p.y && p.y <= std::max( a.y, b.y );
}

bool segmentsIntersect( const Vector2d& a, const Vector2d& b, const Vector2d& c, const Vector2d& d )
{
    const int o1 = sign( cross( b - a, c - a ) );
    const int o2 = sign( cross( b - a, d - a ) );
    const int o3 = sign( cross( d - c, a - c ) );
    const int o4 = sign( cross( d - c, b - c ) );
    if ( o1 != o2 && o3 != o4 )
        return true;
    return ( o1 == 0 && onSegment( a, b, c ) ) ||
           ( o2 == 0 && onSegment( a, b, d ) ) ||
           ( o3 == 0 && onSegment( c, d, a ) ) ||
           ( o4 == 0 && onSegment( c, d, b ) );
}

bool contoursIntersect( const Contour2d& c0, const Contour2d& c1 )
{
    const auto box1 = computeBoundingBox( c1 );
    for ( size_t i = 0; i < c0.size(); ++i )
    {
        const auto& a = c0[i];
        const auto& b = c0[( i + 1 ) % c0.size()];
        Box2d edgeBox;
        edgeBox.include( a );
        edgeBox.include( b );
        if ( !edgeBox.intersects( box1 ) )
            continue;
        for ( size_t j = 0; j < c1.size(); ++j )
            if ( segmentsIntersect( a, b, c1[j], c1[( j + 1 ) % c1.size()] ) )
                return true;
    }
    return false;
}

// inclusive test, orientation of the triangle is not important
bool isPointInTriangle( const Vector2d& p, const Vector2d& a, const Vector2d& b, const Vector2d& c, bool strict )
{
    double d0 = cross( b - a, p - a );
    double d1 = cross( c - b, p - b );
    double d2 = cross( a - c, p - c );
    if ( cross( b - a, c - a ) < 0 )
    {
        d0 = -d0;
        d1 = -d1;
        d2 = -d2;
    }
    if ( strict )
        return d0 > 0 && d1 > 0 && d2 > 0;
    return d0 >= 0 && d1 >= 0 && d2 >= 0;
}

// polygon given by point ids in counter-clockwise order, may contain repeating points after hole bridging
class EarClipper
{
public:
    EarClipper( const Contour2d& points, std::vector<int> poly ) : points_{ points }, poly_{ std::move( poly ) } {}

    Expected<Triangulation> run();

private:
    const Vector2d& pt( int pos ) const { return points_[poly_[pos]]; }
    double turn( int pos ) const { return cross( pt( pos ) - pt( prev_[pos] ), pt( next_[pos] ) - pt( pos ) ); }
    bool isEar( int pos, bool strict ) const;
    void clip( int pos, Triangulation& res );

    const Contour2d& points_;
    std::vector<int> poly_;
    std::vector<int> prev_;
    std::vector<int> next_;
};

bool EarClipper::isEar( int pos, bool strict ) const
{
    if ( turn( pos ) <= 0 )
        return false;
    const auto& a = pt( prev_[pos] );
    const auto& b = pt( pos );
    const auto& c = pt( next_[pos] );
    for ( int k = next_[next_[pos]]; k != prev_[pos]; k = next_[k] )
    {
        const auto& q = pt( k );
        if ( q == a || q == b || q == c )
            continue;
        if ( isPointInTriangle( q, a, b, c, strict ) )
            return false;
    }
    return true;
}

void EarClipper::clip( int pos, Triangulation& res )
{
    res.push_back( { poly_[prev_[pos]], poly_[pos], poly_[next_[pos]] } );
    next_[prev_[pos]] = next_[pos];
    prev_[next_[pos]] = prev_[pos];
}

Expected<Triangulation> EarClipper::run()
{
    const int n = int( poly_.size() );
    if ( n < 3 )
        return unexpected( "Region has less than 3 points" );
    prev_.resize( n );
    next_.resize( n );
    for ( int i = 0; i < n; ++i )
    {
        prev_[i] = ( i + n - 1 ) % n;
        next_[i] = ( i + 1 ) % n;
    }

    Triangulation res;
    res.reserve( n - 2 );
    int remaining = n;
    int cur = 0;
    int stall = 0;
    while ( remaining > 3 )
    {
        if ( isEar( cur, false ) )
        {
            const int nextPos = next_[cur];
            clip( cur, res );
            --remaining;
            cur = nextPos;
            stall = 0;
            continue;
        }
        cur = next_[cur];
        if ( ++stall < remaining )
            continue;

        // no regular ear: allow points on the ear boundary, then degenerate ears
        int found = -1;
        int k = cur;
        for ( int i = 0; i < remaining && found < 0; ++i, k = next_[k] )
            if ( isEar( k, true ) )
                found = k;
        k = cur;
        for ( int i = 0; i < remaining && found < 0; ++i, k = next_[k] )
            if ( std::abs( turn( k ) ) <= 1e-12 )
                found = k;
        if ( found < 0 )
            return unexpected( "Failed to triangulate region: no ear found" );
        const int nextPos = next_[found];
        clip( found, res );
        --remaining;
        cur = nextPos;
        stall = 0;
    }
    res.push_back( { poly_[prev_[cur]], poly_[cur], poly_[next_[cur]] } );
    return res;
}

// true if the direction from polygon position to the point goes inside the polygon
bool isLocallyInside( const Contour2d& points, const std::vector<int>& poly, int pos, const Vector2d& target )
{
    const int n = int( poly.size() );
    const auto& a = points[poly[pos]];
    const auto& p = points[poly[( pos + n - 1 ) % n]];
    const auto& nx = points[poly[( pos + 1 ) % n]];
    const auto d = target - a;
    if ( cross( a - p, nx - a ) >= 0 )
        return cross( nx - a, d ) >= 0 && cross( d, p - a ) >= 0;
    return !( cross( p - a, d ) > 0 && cross( d, nx - a ) > 0 );
}

// connects the hole to the polygon with a double edge from its rightmost point
Expected<void> bridgeHole( const Contour2d& points, std::vector<int>& poly, const std::vector<int>& hole )
{
    int mi = 0;
    for ( int i = 1; i < int( hole.size() ); ++i )
    {
        const auto& p = points[hole[i]];
        const auto& m = points[hole[mi]];
        if ( p.x > m.x || ( p.x == m.x && p.y < m.y ) )
            mi = i;
    }
    const auto m = points[hole[mi]];

    // cast the ray from m in +x direction
    const int n = int( poly.size() );
    double bestX = std::numeric_limits<double>::max();
    int bestEdge = -1;
    for ( int k = 0; k < n; ++k )
    {
        const auto& a = points[poly[k]];
        const auto& b = points[poly[( k + 1 ) % n]];
        if ( a.y > m.y || b.y < m.y || a.y == b.y )
            continue;
        const double x = a.x + ( m.y - a.y ) * ( b.x - a.x ) / ( b.y - a.y );
        if ( x >= m.x && x < bestX )
        {
            bestX = x;
            bestEdge = k;
        }
    }
    if ( bestEdge < 0 )
        return unexpected( "Failed to connect hole to region boundary" );

    const Vector2d hit{ bestX, m.y };
    const int edgeStart = bestEdge;
    const int edgeEnd = ( bestEdge + 1 ) % n;
    int bridgePos = points[poly[edgeStart]].x > points[poly[edgeEnd]].x ? edgeStart : edgeEnd;
    if ( points[poly[edgeStart]] == hit )
        bridgePos = edgeStart;
    else if ( points[poly[edgeEnd]] == hit )
        bridgePos = edgeEnd;
    else
    {
        // a vertex inside triangle (m, hit, candidate) hides the candidate, take the one with the smallest angle to the ray
        const auto cand = points[poly[bridgePos]];
        double bestTan = std::numeric_limits<double>::max();
        double bestDist = std::numeric_limits<double>::max();
        for ( int k = 0; k < n; ++k )
        {
            const auto& q = points[poly[k]];
            if ( q == cand || q.x < m.x || !isPointInTriangle( q, m, hit, cand, false ) )
                continue;
            const double dx = q.x - m.x;
            const double tan = dx > 0 ? std::abs( q.y - m.y ) / dx : std::numeric_limits<double>::max();
            const double dist = distanceSq( q, m );
            if ( ( tan < bestTan || ( tan == bestTan && dist < bestDist ) ) && isLocallyInside( points, poly, k, m ) )
            {
                bestTan = tan;
                bestDist = dist;
                bridgePos = k;
            }
        }
    }

    // the same point may appear several times after previous bridges
    const auto bridgePt = points[poly[bridgePos]];
    if ( !isLocallyInside( points, poly, bridgePos, m ) )
    {
        for ( int k = 0; k < n; ++k )
        {
            if ( k != bridgePos && points[poly[k]] == bridgePt && isLocallyInside( points, poly, k, m ) )
            {
                bridgePos = k;
                break;
            }
        }
    }

    std::vector<int> res;
    res.reserve( poly.size() + hole.size() + 2 );
    res.insert( res.end(), poly.begin(), poly.begin() + bridgePos + 1 );
    for ( int i = 0; i <= int( hole.size() ); ++i )
        res.push_back( hole[( mi + i ) % hole.size()] );
    res.insert( res.end(), poly.begin() + bridgePos, poly.end() );
    poly = std::move( res );
    return {};
}

// identifies points by their coordinates rounded on fine grid, so equal intersection points of different edges get one id
class VertexIndexer
{
public:
    explicit VertexIndexer( double gridStep ) : invStep_{ 1 / gridStep } {}

    int add( const Vector2d& p )
    {
        const std::pair<long long, long long> key{ std::llround( p.x * invStep_ ), std::llround( p.y * invStep_ ) };
        auto [it, inserted] = ids_.try_emplace( key, int( points.size() ) );
        if ( inserted )
            points.push_back( p );
        return it->second;
    }

    Contour2d points;

private:
    double invStep_;
    std::map<std::pair<long long, long long>, int> ids_;
};

struct SplitSegment
{
    int org = -1;
    int dest = -1;
    /// parameters along the segment and ids of the points splitting it
    std::vector<std::pair<double, int>> splits;
};

// adds the points where segments s0 and s1 cross or overlap to their splits
void intersectSegments( VertexIndexer& indexer, SplitSegment& s0, SplitSegment& s1, double gridStep )
{
    const auto p = indexer.points[s0.org];
    const auto r = indexer.points[s0.dest] - p;
    const auto q = indexer.points[s1.org];
    const auto d = indexer.points[s1.dest] - q;
    const double lenR = r.length();
    const double lenD = d.length();
    const double denom = cross( r, d );
    constexpr double paramEps = 1e-9;

    if ( std::abs( denom ) > 1e-12 * lenR * lenD )
    {
        const double t0 = cross( q - p, d ) / denom;
        const double t1 = cross( q - p, r ) / denom;
        if ( t0 < -paramEps || t0 > 1 + paramEps || t1 < -paramEps || t1 > 1 + paramEps )
            return;
        const int id = indexer.add( p + std::clamp( t0, 0.0, 1.0 ) * r );
        s0.splits.emplace_back( t0, id );
        s1.splits.emplace_back( t1, id );
        return;
    }

    // parallel segments overlap only if they are on one line
    if ( std::abs( cross( q - p, r ) ) > gridStep * lenR )
        return;
    auto project = [&] ( SplitSegment& seg, const Vector2d& org, const Vector2d& dir, int pointId )
    {
        const double t = dot( indexer.points[pointId] - org, dir ) / dot( dir, dir );
        if ( t > 0 && t < 1 )
            seg.splits.emplace_back( t, pointId );
    };
    project( s0, p, r, s1.org );
    project( s0, p, r, s1.dest );
    project( s1, q, d, s0.org );
    project( s1, q, d, s0.dest );
}

// winding number of the point relative to directed edges with multiplicities
int windingNumber( const Contour2d& points, const std::vector<std::pair<std::pair<int, int>, int>>& edges, const Vector2d& pt )
{
    int res = 0;
    for ( const auto& [edge, mult] : edges )
    {
        const auto& a = points[edge.first];
        const auto& b = points[edge.second];
        if ( a.y <= pt.y )
        {
            if ( b.y > pt.y && cross( b - a, pt - a ) > 0 )
                res += mult;
        }
        else if ( b.y <= pt.y && cross( b - a, pt - a ) < 0 )
        {
            res -= mult;
        }
    }
    return res;
}

bool isInner( int winding, WindingMode mode )
{
    switch ( mode )
    {
    case WindingMode::Positive:
        return winding > 0;
    case WindingMode::Negative:
        return winding < 0;
    default:
        return winding != 0;
    }
}

// angle of clockwise rotation from direction a to direction b in (0, 2pi]
double clockwiseAngle( const Vector2d& a, const Vector2d& b )
{
    double angle = std::atan2( cross( b, a ), dot( b, a ) );
    if ( angle <= 0 )
        angle += 2 * PI;
    return angle;
}

} //anonymous namespace

std::optional<std::pair<int, int>> findIntersectingContours( const Contours2d& contours )
{
    DS_TIMER;
    std::vector<Box2d> boxes;
    boxes.reserve( contours.size() );
    for ( const auto& c : contours )
        boxes.push_back( computeBoundingBox( c ) );

    for ( int i = 0; i < int( contours.size() ); ++i )
    {
        for ( int j = i + 1; j < int( contours.size() ); ++j )
        {
            if ( !boxes[i].valid() || !boxes[j].valid() || !boxes[i].intersects( boxes[j] ) )
                continue;
            if ( contoursIntersect( contours[i], contours[j] ) )
                return std::make_pair( i, j );
        }
    }
    return {};
}

Contours2d getOutline( const Contours2d& contours, const OutlineParameters& params )
{
    DS_TIMER;
    const auto box = computeBoundingBox( contours );
    if ( !box.valid() )
        return {};
    const double gridStep = std::max( box.size().length(), 1.0 ) * 1e-10;

    VertexIndexer indexer( gridStep );
    std::vector<SplitSegment> segments;
    for ( const auto& c : contours )
    {
        if ( c.size() < 3 )
            continue;
        std::vector<int> ids( c.size() );
        for ( size_t i = 0; i < c.size(); ++i )
            ids[i] = indexer.add( c[i] );
        for ( size_t i = 0; i < ids.size(); ++i )
        {
            const int next = ids[( i + 1 ) % ids.size()];
            if ( ids[i] != next )
                segments.push_back( { ids[i], next, {} } );
        }
    }

    // sweep along x-axis to find all crossings
    std::vector<Box2d> boxes( segments.size() );
    std::vector<int> order( segments.size() );
    for ( int i = 0; i < int( segments.size() ); ++i )
    {
        boxes[i].include( indexer.points[segments[i].org] );
        boxes[i].include( indexer.points[segments[i].dest] );
        boxes[i].min -= Vector2d::diagonal( gridStep );
        boxes[i].max += Vector2d::diagonal( gridStep );
        order[i] = i;
    }
    std::sort( order.begin(), order.end(), [&] ( int a, int b ) { return boxes[a].min.x < boxes[b].min.x; } );
    for ( size_t i = 0; i < order.size(); ++i )
    {
        const int s0 = order[i];
        for ( size_t j = i + 1; j < order.size() && boxes[order[j]].min.x <= boxes[s0].max.x; ++j )
        {
            const int s1 = order[j];
            if ( boxes[s0].intersects( boxes[s1] ) )
                intersectSegments( indexer, segments[s0], segments[s1], gridStep );
        }
    }

    // split segments, coinciding pieces of different segments sum up their directions
    std::map<std::pair<int, int>, int> multiplicity;
    for ( auto& seg : segments )
    {
        auto& splits = seg.splits;
        splits.emplace_back( 0.0, seg.org );
        splits.emplace_back( 1.0, seg.dest );
        std::sort( splits.begin(), splits.end() );
        int prev = splits.front().second;
        for ( size_t i = 1; i < splits.size(); ++i )
        {
            const int cur = splits[i].second;
            if ( cur == prev )
                continue;
            if ( prev < cur )
                ++multiplicity[{ prev, cur }];
            else
                --multiplicity[{ cur, prev }];
            prev = cur;
        }
    }
    std::vector<std::pair<std::pair<int, int>, int>> edges;
    edges.reserve( multiplicity.size() );
    for ( const auto& edge : multiplicity )
        if ( edge.second != 0 )
            edges.push_back( edge );

    // keep the pieces separating inner and outer parts, inner part on the left
    const auto& points = indexer.points;
    std::vector<std::pair<int, int>> boundary( edges.size(), { -1, -1 } );
    tbb::parallel_for( tbb::blocked_range<size_t>( 0, edges.size() ), [&] ( const tbb::blocked_range<size_t>& range )
    {
        for ( size_t e = range.begin(); e < range.end(); ++e )
        {
            const auto [a, b] = edges[e].first;
            const auto dir = points[b] - points[a];
            const double len = dir.length();
            const Vector2d right{ dir.y / len, -dir.x / len };
            const auto sample = 0.5 * ( points[a] + points[b] ) + std::max( len * 1e-4, gridStep * 100 ) * right;
            const int rightWinding = windingNumber( points, edges, sample );
            const int leftWinding = rightWinding + edges[e].second;
            const bool leftInner = isInner( leftWinding, params.innerType );
            if ( leftInner == isInner( rightWinding, params.innerType ) )
                continue;
            boundary[e] = leftInner ? std::make_pair( a, b ) : std::make_pair( b, a );
        }
    } );
    boundary.erase( std::remove( boundary.begin(), boundary.end(), std::make_pair( -1, -1 ) ), boundary.end() );

    std::vector<std::vector<int>> outEdges( points.size() );
    for ( int e = 0; e < int( boundary.size() ); ++e )
        outEdges[boundary[e].first].push_back( e );

    // collect loops turning left at the vertices shared by several loops
    Contours2d res;
    std::vector<bool> used( boundary.size(), false );
    for ( int start = 0; start < int( boundary.size() ); ++start )
    {
        if ( used[start] )
            continue;
        Contour2d loop;
        bool closed = false;
        int e = start;
        for ( ;; )
        {
            used[e] = true;
            loop.push_back( points[boundary[e].first] );
            const int v = boundary[e].second;
            if ( v == boundary[start].first )
            {
                closed = true;
                break;
            }
            const auto back = points[boundary[e].first] - points[v];
            int next = -1;
            double bestAngle = std::numeric_limits<double>::max();
            for ( int cand : outEdges[v] )
            {
                if ( used[cand] )
                    continue;
                const double angle = clockwiseAngle( back, points[boundary[cand].second] - points[v] );
                if ( angle < bestAngle )
                {
                    bestAngle = angle;
                    next = cand;
                }
            }
            if ( next < 0 )
                break;
            e = next;
        }
        if ( !closed )
        {
            spdlog::warn( "getOutline: open boundary chain of {} points is skipped", loop.size() );
            continue;
        }
        removeDegeneratePoints( loop );
        if ( loop.size() >= 3 )
            res.push_back( std::move( loop ) );
    }
    return res;
}

ContourTree buildContourTree( Contours2d contours )
{
    DS_TIMER;
    ContourTree tree;
    for ( auto& c : contours )
    {
        removeDegeneratePoints( c );
        if ( c.size() >= 3 )
            tree.contours.push_back( std::move( c ) );
    }

    const int n = int( tree.contours.size() );
    std::vector<double> areas( n );
    std::vector<Box2d> boxes( n );
    for ( int i = 0; i < n; ++i )
    {
        areas[i] = std::abs( calcOrientedArea<double>( tree.contours[i] ) );
        boxes[i] = computeBoundingBox( tree.contours[i] );
    }

    tree.parent.assign( n, -1 );
    tree.depth.assign( n, 0 );
    for ( int i = 0; i < n; ++i )
    {
        // contours may touch at vertices, but not along edges
        const auto& c = tree.contours[i];
        const auto sample = 0.5 * ( c[0] + c[1] );
        for ( int j = 0; j < n; ++j )
        {
            if ( j == i || areas[j] < areas[i] || !boxes[j].contains( sample ) )
                continue;
            if ( !isPointInContour( tree.contours[j], sample ) )
                continue;
            ++tree.depth[i];
            if ( tree.parent[i] < 0 || areas[j] < areas[tree.parent[i]] )
                tree.parent[i] = j;
        }
    }

    tree.firstVert.resize( n + 1 );
    tree.firstVert[0] = 0;
    for ( int i = 0; i < n; ++i )
    {
        auto& c = tree.contours[i];
        const bool ccw = calcOrientedArea<double>( c ) > 0;
        if ( ccw != tree.isMaterial( i ) )
            std::reverse( c.begin(), c.end() );
        tree.firstVert[i + 1] = tree.firstVert[i] + int( c.size() );
    }
    return tree;
}

Expected<Triangulation> triangulateRegion( const Contour2d& outer, const Contours2d& holes )
{
    Contour2d points = outer;
    std::vector<int> poly( outer.size() );
    std::iota( poly.begin(), poly.end(), 0 );
    if ( calcOrientedArea<double>( outer ) < 0 )
        std::reverse( poly.begin(), poly.end() );

    std::vector<std::vector<int>> holeRings;
    holeRings.reserve( holes.size() );
    for ( const auto& h : holes )
    {
        const int firstId = int( points.size() );
        // points of degenerate holes keep their ids but take no part in triangulation
        points.insert( points.end(), h.begin(), h.end() );
        if ( h.size() < 3 )
            continue;
        std::vector<int> ring( h.size() );
        std::iota( ring.begin(), ring.end(), firstId );
        if ( calcOrientedArea<double>( h ) > 0 )
            std::reverse( ring.begin(), ring.end() );
        holeRings.push_back( std::move( ring ) );
    }

    auto maxX = [&] ( const std::vector<int>& ring )
    {
        double res = std::numeric_limits<double>::lowest();
        for ( int v : ring )
            res = std::max( res, points[v].x );
        return res;
    };
    std::sort( holeRings.begin(), holeRings.end(), [&] ( const auto& a, const auto& b )
    {
        return maxX( a ) > maxX( b );
    } );
    for ( const auto& ring : holeRings )
        DS_RETURN_IF_UNEXPECTED( bridgeHole( points, poly, ring ) )

    return EarClipper( points, std::move( poly ) ).run();
}

Expected<Triangulation> triangulateRegions( const ContourTree& tree, int depthParity )
{
    DS_TIMER;
    std::vector<int> outers;
    for ( int i = 0; i < int( tree.size() ); ++i )
        if ( tree.depth[i] % 2 == depthParity )
            outers.push_back( i );

    std::vector<Expected<Triangulation>> regionTris( outers.size() );
    tbb::parallel_for( tbb::blocked_range<size_t>( 0, outers.size() ), [&] ( const tbb::blocked_range<size_t>& range )
    {
        for ( size_t r = range.begin(); r < range.end(); ++r )
        {
            const int outer = outers[r];
            const auto holeIds = tree.children( outer );
            Contours2d holes;
            holes.reserve( holeIds.size() );
            // local ids to global ones
            std::vector<int> globalIds;
            for ( int v = 0; v < int( tree.contours[outer].size() ); ++v )
                globalIds.push_back( tree.firstVert[outer] + v );
            for ( int h : holeIds )
            {
                holes.push_back( tree.contours[h] );
                for ( int v = 0; v < int( tree.contours[h].size() ); ++v )
                    globalIds.push_back( tree.firstVert[h] + v );
            }
            auto tris = triangulateRegion( tree.contours[outer], holes );
            if ( tris )
                for ( auto& t : *tris )
                    for ( auto& v : t )
                        v = globalIds[v];
            regionTris[r] = std::move( tris );
        }
    } );

    Triangulation res;
    for ( auto& tris : regionTris )
    {
        if ( !tris )
            return unexpected( std::move( tris.error() ) );
        res.insert( res.end(), tris->begin(), tris->end() );
    }
    return res;
}

} //namespace PlanarTriangulation

} //namespace DS
