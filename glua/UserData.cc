#include "UserData.hh"

#include <map>

using namespace GLua;

namespace {

std::map<UserDataType, const char*> typeNames = {
  { UserDataType::None, "None" },
  { UserDataType::Nil, "Nil" },
  { UserDataType::Bool, "Bool" },
  { UserDataType::LightUserData, "LightUserData" },
  { UserDataType::Number, "Number" },
  { UserDataType::String, "String" },
  { UserDataType::Table, "Table" },
  { UserDataType::Function, "Function" },
  { UserDataType::UserData, "UserData" },
  { UserDataType::Thread, "Thread" },
  { UserDataType::Entity, "Entity" },
  { UserDataType::Vector, "Vector" },
  { UserDataType::Angle, "Angle" },
  { UserDataType::PhysObj, "PhysObj" },
  { UserDataType::Save, "Save" },
  { UserDataType::Restore, "Restore" },
  { UserDataType::DamageInfo, "DamageInfo" },
  { UserDataType::EffectData, "EffectData" },
  { UserDataType::MoveData, "MoveData" },
  { UserDataType::RecipientFilter, "RecipientFilter" },
  { UserDataType::UserCmd, "UserCmd" },
  { UserDataType::ScriptedVehicle, "ScriptedVehicle" },
  { UserDataType::Material, "Material" },
  { UserDataType::Panel, "Panel" },
  { UserDataType::Particle, "Particle" },
  { UserDataType::ParticleEmitter, "ParticleEmitter" },
  { UserDataType::Texture, "Texture" },
  { UserDataType::UserMsg, "UserMsg" },
  { UserDataType::ConVar, "ConVar" },
  { UserDataType::IMesh, "IMesh" },
  { UserDataType::Matrix, "Matrix" },
  { UserDataType::Sound, "Sound" },
  { UserDataType::PixelVisHandle, "PixelVisHandle" },
  { UserDataType::DLight, "DLight" },
  { UserDataType::Video, "Video" },
  { UserDataType::File, "File" },
  { UserDataType::Locomotion, "Locomotion" },
  { UserDataType::Path, "Path" },
  { UserDataType::NavArea, "NavArea" },
  { UserDataType::SoundHandle, "SoundHandle" },
  { UserDataType::NavLadder, "NavLadder" },
  { UserDataType::ParticleSystem, "ParticleSystem" },
  { UserDataType::ProjectedTexture, "ProjectedTexture" },
  { UserDataType::PhysCollide, "PhysCollide" },
  { UserDataType::SurfaceInfo, "SurfaceInfo" },
  { UserDataType::MAX, "MAX" },
};

} // namespace

const char* GLua::userDataTypeName(UserDataType type) {
  auto name = typeNames.find(type);
  if (name != typeNames.end()) {
    return name->second;
  }
  return "unknown";
}

UserDataTypeMismatch::UserDataTypeMismatch(UserDataType expected, UserDataType actual)
  : std::runtime_error(std::string("expected userdata of type ") + userDataTypeName(expected)
      + ", got " + userDataTypeName(actual)),
    _expected(expected),
    _actual(actual)
{
}
