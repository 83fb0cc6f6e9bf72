/**
 * @file Stowage.hpp
 * @brief Single include for applications: handles, declarations, formats and settings.
 */

#pragma once

#include "application/FileBinding.hpp"
#include "application/Persistent.hpp"
#include "domain/Binding.hpp"
#include "domain/DirectoryKind.hpp"
#include "domain/Errors.hpp"
#include "domain/Metadata.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PathResolver.hpp"
#include "infrastructure/Umask.hpp"
#include "infrastructure/codecs/Codecs.hpp"
