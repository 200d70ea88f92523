/*
 * Copyright 2019 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef RMB_MSG0
#define RMB_MSG0(severity, id, format, ...) RMB_MSG(severity, id, format)
#define RMB_MSG1(severity, id, format, ...) RMB_MSG(severity, id, format)
#define RMB_MSG2(severity, id, format, ...) RMB_MSG(severity, id, format)
#define RMB_MSG3(severity, id, format, ...) RMB_MSG(severity, id, format)
#endif  // RMB_MSG0

RMB_MSG3(ERROR, ASSERT                       , "%s(%d) : ASSERT(%s)", const char*, file, int, line, const char*, expression)
RMB_MSG1(ERROR, LOAD_PLUGINS                 , "Unable to load USD plugins. %s", const char*, why)
RMB_MSG1(ERROR, ARGUMENT_UNKNOWN             , "Unknown flag: %s", const char*, text)
RMB_MSG0(ERROR, ARGUMENT_PATHS               , "No input paths. Expected: src [src ...].")
RMB_MSG2(ERROR, ARGUMENT_EXCEPTION           , "%s: %s", const char*, id, const char*, err)
RMB_MSG2(ERROR, USD                          , "USD: %s (%s)", const char*, commentary, const char*, function)
RMB_MSG2(WARN , USD                          , "USD: %s (%s)", const char*, commentary, const char*, function)
RMB_MSG2(INFO , USD                          , "USD: %s (%s)", const char*, commentary, const char*, function)
RMB_MSG2(ERROR, USD_FATAL                    , "USD: FATAL: %s (%s)", const char*, commentary, const char*, function)
RMB_MSG1(ERROR, AMBIGUOUS_HIERARCHY          , "Expected exactly one parentless bone, found %zu.", size_t, root_count)
RMB_MSG1(ERROR, ALREADY_PROCESSED            , "Armature already has a root motion bone named '%s'.", const char*, root_name)
RMB_MSG1(ERROR, UNKNOWN_BONE                 , "Bone not found: '%s'.", const char*, bone_name)
RMB_MSG1(ERROR, MISSING_ARMATURE             , "No armature found in scene (name='%s').", const char*, name)
RMB_MSG1(ERROR, HIP_NOT_ROOT                 , "Hip bone '%s' is not a parentless bone.", const char*, hip_name)
RMB_MSG1(ERROR, BONE_EXISTS                  , "Bone already exists: '%s'.", const char*, bone_name)
RMB_MSG2(ERROR, HIP_PARENT                   , "Hip bone '%s' is not a direct child of root bone '%s'.", const char*, hip_name, const char*, root_name)
RMB_MSG1(ERROR, CREATE_BONE                  , "Cannot create bone: '%s'.", const char*, bone_name)
RMB_MSG2(ERROR, REPARENT                     , "Cannot parent bone '%s' to '%s'.", const char*, bone_name, const char*, parent_name)
RMB_MSG1(ERROR, IMPORT                       , "Cannot import: \"%s\"", const char*, path)
RMB_MSG1(ERROR, EXPORT                       , "Cannot export: \"%s\"", const char*, path)
RMB_MSG1(ERROR, IO_READ_USD                  , "Cannot open USD stage: \"%s\"", const char*, path)
RMB_MSG1(ERROR, IO_WRITE_USD                 , "Cannot write USD: \"%s\"", const char*, path)
RMB_MSG1(ERROR, LAYER_CREATE                 , "Cannot create layer at: %s", const char*, dst_path)
RMB_MSG1(WARN , IO_READ                      , "Cannot read file: \"%s\"", const char*, path)
RMB_MSG1(WARN , IO_WRITE_IMAGE               , "Cannot write image: \"%s\"", const char*, path)
RMB_MSG1(WARN , IO_COPY_TEXTURE              , "Cannot copy texture: \"%s\"", const char*, path)
RMB_MSG1(WARN , CREATE_DIRECTORY             , "Cannot create directory: \"%s\". Will convert without exporting.", const char*, path)
RMB_MSG1(WARN , TEXTURES_DIRECTORY           , "Cannot create textures directory: \"%s\". Saving textures to the export directory.", const char*, path)
RMB_MSG0(WARN , NO_FILE_NAME                 , "No output file name. Will convert without exporting.")
RMB_MSG1(WARN , DIAGNOSTICS_OPEN             , "Cannot open diagnostics file: \"%s\"", const char*, path)
RMB_MSG2(WARN , SETTINGS_READ                , "Cannot read settings \"%s\": %s", const char*, path, const char*, why)
RMB_MSG1(WARN , SETTINGS_WRITE               , "Cannot write settings: \"%s\"", const char*, path)
RMB_MSG2(WARN , SETTINGS_VALUE               , "Ignoring invalid setting %s=\"%s\".", const char*, key, const char*, value)
RMB_MSG1(WARN , SKELETON_TOPOLOGY            , "Skipping skeleton with invalid joint topology: %s", const char*, why)
RMB_MSG0(WARN , MESH_GEOMETRY_MISSING        , "Mesh geometry is unavailable without a source layer, so it is not exported.")
RMB_MSG1(WARN , ANIMATION_JOINT_COUNT        , "Skipping animation with mismatched joint data: %s", const char*, path)
RMB_MSG1(INFO , CLEARED_ANIMATIONS           , "Removed %zu leftover animation(s).", size_t, count)
RMB_MSG1(INFO , CLEARED_IMAGES               , "Removed %zu leftover image(s).", size_t, count)
