#pragma once

#include "common/error.hpp"
#include "common/version.hpp"
#include "package/checksums.hpp"
#include "package/pack_options.hpp"
#include "package/package.hpp"
#include "schema/level.hpp"
#include "schema/manifest.hpp"
#include "voxel/collision.hpp"
#include "voxel/rlevox.hpp"
#include "voxel/voxel_field.hpp"
