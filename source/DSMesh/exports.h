#pragma once

#ifdef _WIN32
#   ifdef DSMesh_EXPORTS
#       define DSMESH_API __declspec(dllexport)
#   else
#       define DSMESH_API __declspec(dllimport)
#   endif
#   define DSMESH_CLASS
#else
#   define DSMESH_API   __attribute__((visibility("default")))
// to fix undefined reference to `typeinfo/vtable`
#   define DSMESH_CLASS __attribute__((visibility("default")))
#endif
