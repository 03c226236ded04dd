// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <vault/key_bundle.h>
#include <vault/crypter.h>
#include <pubkey.h>
#include <util/logging.h>
#include <util/serialize.h>

#include <cstring>
#include <stdexcept>

namespace {

const uint8_t BUNDLE_MAGIC[8] = {'C', 'N', 'R', 'Y', 'K', 'E', 'Y', '1'};

// Generous bounds for length prefixes; IsValid() applies the exact sizes
const size_t MAX_FIELD_SIZE = 1024;

void DecodeVersion1Body(CDataStream& stream, CKeyBundle& bundle) {
    bundle.nDeriveIterations = stream.ReadUint32();
    bundle.vchSalt = stream.ReadBytes(MAX_FIELD_SIZE);
    bundle.vchIV = stream.ReadBytes(MAX_FIELD_SIZE);
    bundle.vchCiphertext = stream.ReadBytes(MAX_FIELD_SIZE);
    bundle.vchMAC = stream.ReadBytes(MAX_FIELD_SIZE);
    bundle.strAddress = stream.ReadString(MAX_FIELD_SIZE);
}

} // namespace

bool CKeyBundle::IsValid() const {
    return nVersion == VERSION_1 &&
           nDeriveIterations >= VAULT_MIN_KDF_ITERATIONS &&
           nDeriveIterations <= VAULT_MAX_BUNDLE_KDF_ITERATIONS &&
           vchSalt.size() == VAULT_SALT_SIZE &&
           vchIV.size() == VAULT_IV_SIZE &&
           vchCiphertext.size() == VAULT_CIPHERTEXT_SIZE &&
           vchMAC.size() == VAULT_MAC_SIZE &&
           IsHexAddress(strAddress);
}

std::vector<uint8_t> EncodeKeyBundle(const CKeyBundle& bundle) {
    CDataStream stream;
    stream.write(BUNDLE_MAGIC, sizeof(BUNDLE_MAGIC));
    stream.WriteUint32(bundle.nVersion);
    stream.WriteUint32(bundle.nDeriveIterations);
    stream.WriteBytes(bundle.vchSalt);
    stream.WriteBytes(bundle.vchIV);
    stream.WriteBytes(bundle.vchCiphertext);
    stream.WriteBytes(bundle.vchMAC);
    stream.WriteString(bundle.strAddress);
    return stream.GetData();
}

VaultError DecodeKeyBundle(const std::vector<uint8_t>& blob, CKeyBundle& bundle) {
    CDataStream stream(blob);
    CKeyBundle decoded;

    try {
        uint8_t magic[sizeof(BUNDLE_MAGIC)];
        stream.read(magic, sizeof(magic));
        if (memcmp(magic, BUNDLE_MAGIC, sizeof(BUNDLE_MAGIC)) != 0) {
            LogPrintVault(WARN, "Key bundle has an unknown magic");
            return VaultError::DATA_CORRUPTION;
        }

        decoded.nVersion = stream.ReadUint32();
        switch (decoded.nVersion) {
            case CKeyBundle::VERSION_1:
                DecodeVersion1Body(stream, decoded);
                break;
            default:
                LogPrintVault(WARN, "Key bundle version %u is not supported", decoded.nVersion);
                return VaultError::UNSUPPORTED_VERSION;
        }
    } catch (const std::runtime_error& e) {
        LogPrintVault(WARN, "Key bundle is truncated or malformed: %s", e.what());
        return VaultError::DATA_CORRUPTION;
    }

    if (!stream.eof()) {
        LogPrintVault(WARN, "Key bundle has %zu trailing bytes", stream.remaining());
        return VaultError::DATA_CORRUPTION;
    }
    if (!decoded.IsValid()) {
        LogPrintVault(WARN, "Key bundle fields are out of range");
        return VaultError::DATA_CORRUPTION;
    }

    bundle = std::move(decoded);
    return VaultError::OK;
}
