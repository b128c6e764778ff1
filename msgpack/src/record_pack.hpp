#pragma once
#include "package.hpp"
#include "canonical.hpp"
#include <vector>
#include <cstdint>

// Canonical msgpack records stored in a package container:
//   manifest   -> PackageManifest
//   recipients -> RecipientSet
//   signature  -> SignatureBlock
// All unpack functions throw FormatError on malformed input.

namespace record_mp {
    canon::Value         manifest_to_value(const PackageManifest& m);
    PackageManifest      manifest_from_value(const canon::Value& v);

    std::vector<uint8_t> pack_manifest(const PackageManifest& m);
    PackageManifest      unpack_manifest(const std::vector<uint8_t>& data);

    std::vector<uint8_t> pack_recipients(const RecipientSet& r);
    RecipientSet         unpack_recipients(const std::vector<uint8_t>& data);

    std::vector<uint8_t> pack_signature(const SignatureBlock& s);
    SignatureBlock       unpack_signature(const std::vector<uint8_t>& data);
}
