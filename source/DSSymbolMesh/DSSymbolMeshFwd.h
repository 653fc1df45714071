#pragma once

// see explanation in DSMesh/exports.h
#ifdef _WIN32
#   ifdef DSSymbolMesh_EXPORTS
#       define DSSYMBOLMESH_API __declspec(dllexport)
#   else
#       define DSSYMBOLMESH_API __declspec(dllimport)
#   endif
#   define DSSYMBOLMESH_CLASS
#else
#   define DSSYMBOLMESH_API   __attribute__((visibility("default")))
#   ifdef __clang__
#       define DSSYMBOLMESH_CLASS __attribute__((type_visibility("default")))
#   else
#       define DSSYMBOLMESH_CLASS __attribute__((visibility("default")))
#   endif
#endif

#include <DSMesh/DSMeshFwd.h>
