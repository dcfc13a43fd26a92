#pragma once

#include <cbor_inspector/cbor/decode_options.hpp>
#include <cbor_inspector/cbor/detail.hpp>
#include <cbor_inspector/cbor/errors.hpp>
#include <cbor_inspector/cbor/float.hpp>
#include <cbor_inspector/cbor/parse.hpp>
#include <cbor_inspector/cbor/types/value.hpp>
