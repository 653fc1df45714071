#pragma once

#include "exports.h"

#include <array>
#include <vector>

namespace DS
{

template <typename T> struct DSMESH_CLASS Vector2;
using Vector2b = Vector2<bool>;
using Vector2i = Vector2<int>;
using Vector2f = Vector2<float>;
using Vector2d = Vector2<double>;

template <typename T> struct DSMESH_CLASS Vector3;
using Vector3i = Vector3<int>;
using Vector3f = Vector3<float>;
using Vector3d = Vector3<double>;

template <typename V> struct DSMESH_CLASS Box;
using Box2f = Box<Vector2f>;
using Box2d = Box<Vector2d>;
using Box3f = Box<Vector3f>;
using Box3d = Box<Vector3d>;

template <typename V> using Contour = std::vector<V>;
template <typename T> using Contour2 = Contour<Vector2<T>>;
template <typename T> using Contour3 = Contour<Vector3<T>>;
using Contour2d = Contour2<double>;
using Contour2f = Contour2<float>;
using Contour3f = Contour3<float>;

template <typename V> using Contours = std::vector<Contour<V>>;
template <typename T> using Contours2 = Contours<Vector2<T>>;
using Contours2d = Contours2<double>;
using Contours2f = Contours2<float>;

/// vertex ids of one triangle
using ThreeVertIds = std::array<int, 3>;
using Triangulation = std::vector<ThreeVertIds>;

struct DSMESH_CLASS TriMesh;
struct DSMESH_CLASS ContourTree;
class DSMESH_CLASS Config;
class DSMESH_CLASS Logger;

template <typename T>
constexpr inline T sqr( T x ) noexcept { return x * x; }

} //namespace DS
