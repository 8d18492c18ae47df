#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "glua.h"
#include "SymbolTable.hh"

namespace GLua {

/**
 * Type tags of the host's userdata, in the host's numbering.
 */
enum class UserDataType: std::uint8_t {
  None = 255,

  Nil = 0,
  Bool,
  LightUserData,
  Number,
  String,
  Table,
  Function,
  UserData,
  Thread,

  // Game types
  Entity,
  Vector,
  Angle,
  PhysObj,
  Save,
  Restore,
  DamageInfo,
  EffectData,
  MoveData,
  RecipientFilter,
  UserCmd,
  ScriptedVehicle,
  Material,
  Panel,
  Particle,
  ParticleEmitter,
  Texture,
  UserMsg,
  ConVar,
  IMesh,
  Matrix,
  Sound,
  PixelVisHandle,
  DLight,
  Video,
  File,
  Locomotion,
  Path,
  NavArea,
  SoundHandle,
  NavLadder,
  ParticleSystem,
  ProjectedTexture,
  PhysCollide,
  SurfaceInfo,

  MAX,
};

const char* userDataTypeName(UserDataType type);

struct Vector {
  float x;
  float y;
  float z;
};

struct Angle {
  float p;
  float y;
  float r;
};

inline bool operator==(const Vector& a, const Vector& b) { return a.x == b.x && a.y == b.y && a.z == b.z; }
inline bool operator==(const Angle& a, const Angle& b) { return a.p == b.p && a.y == b.y && a.r == b.r; }

/**
 * Maps a native struct to the tag of the host userdata with the same layout.
 * Only types with a specialization can be coerced.
 */
template <typename T> struct UserDataTag;
template <> struct UserDataTag<Vector> { static constexpr UserDataType value = UserDataType::Vector; };
template <> struct UserDataTag<Angle> { static constexpr UserDataType value = UserDataType::Angle; };

class UserDataTypeMismatch: public std::runtime_error {
public:
  UserDataTypeMismatch(UserDataType expected, UserDataType actual);

  UserDataType expected() const { return _expected; }
  UserDataType actual() const { return _actual; }

private:
  UserDataType _expected;
  UserDataType _actual;
};

/**
 * A host userdata pointer with its type tag. The VM owns the memory.
 */
struct TaggedUserData {
  void* data;
  UserDataType type;

  /** Throws `UserDataTypeMismatch` unless the tag is `T`'s */
  template <typename T>
  T& coerce() const {
    if (type != UserDataTag<T>::value) {
      throw UserDataTypeMismatch(UserDataTag<T>::value, type);
    }
    return *static_cast<T*>(data);
  }

  /** The tag must be `T`'s; nothing is checked */
  template <typename T>
  T& coerceUnchecked() const {
    return *static_cast<T*>(data);
  }
};

/**
 * `__gc` metamethod that destroys the `T` held by the userdata at index 1.
 * The VM frees the memory itself.
 */
template <typename T>
int gcFinalizer(glua_State* L) {
  void* userdata = symbols().lua_touserdata(L, 1);
  if (userdata) {
    static_cast<T*>(userdata)->~T();
  }
  return 0;
}

} // namespace GLua
