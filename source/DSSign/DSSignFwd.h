#pragma once

// see explanation in DSMesh/exports.h
#ifdef _WIN32
#   ifdef DSSign_EXPORTS
#       define DSSIGN_API __declspec(dllexport)
#   else
#       define DSSIGN_API __declspec(dllimport)
#   endif
#   define DSSIGN_CLASS
#else
#   define DSSIGN_API   __attribute__((visibility("default")))
#   ifdef __clang__
#       define DSSIGN_CLASS __attribute__((type_visibility("default")))
#   else
#       define DSSIGN_CLASS __attribute__((visibility("default")))
#   endif
#endif

#include <DSMesh/DSMeshFwd.h>

namespace DS
{

struct SignParams;
struct FontParams;
struct GeneratedSign;
struct ValidationRanges;
struct SignError;
class SignValidator;
class SignGenerator;
class SignWorker;
class SignSession;

} //namespace DS
