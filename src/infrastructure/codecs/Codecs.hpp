/**
 * @file Codecs.hpp
 * @brief All built-in file formats.
 */

#pragma once

#include "infrastructure/codecs/BinaryCodec.hpp"
#include "infrastructure/codecs/BsonCodec.hpp"
#include "infrastructure/codecs/CborCodec.hpp"
#include "infrastructure/codecs/EmptyCodec.hpp"
#include "infrastructure/codecs/HeaderedCodec.hpp"
#include "infrastructure/codecs/JsonCodec.hpp"
#include "infrastructure/codecs/MessagePackCodec.hpp"
#include "infrastructure/codecs/PlainCodec.hpp"
#include "infrastructure/codecs/TomlCodec.hpp"
#include "infrastructure/codecs/YamlCodec.hpp"
