#pragma once

// Umbrella header: everything needed to describe records and unions and derive
// their JSON codecs.

#include "adtjson/codec/codec.h"
#include "adtjson/codec/primitive_codecs.h"
#include "adtjson/core/configuration_error.h"
#include "adtjson/core/decode_error.h"
#include "adtjson/core/json.h"
#include "adtjson/core/result.h"
#include "adtjson/core/version.h"
#include "adtjson/derivation/codec_registry.h"
#include "adtjson/derivation/derivation_settings.h"
#include "adtjson/derivation/record.h"
#include "adtjson/derivation/sum.h"
#include "adtjson/derivation/tagging.h"
#include "adtjson/discriminator/tag_codec.h"
#include "adtjson/discriminator/type_tag_format.h"
#include "adtjson/naming/naming_strategy.h"
#include "adtjson/naming/type_identity.h"
