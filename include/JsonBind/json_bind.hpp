#pragma once

#include "codec_arena.hpp"
#include "config.hpp"
#include "customize.hpp"
#include "error_formatting.hpp"
#include "extension.hpp"
#include "options.hpp"
#include "parser.hpp"
#include "registry.hpp"
#include "serializer.hpp"
#include "transformers.hpp"
#include "type_builder.hpp"
