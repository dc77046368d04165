#pragma once
//
// ClientConfigAdapter.h
//
// YAML schema of the external client tool (yaml-cpp):
//
//   envs:                       required sequence
//     - alias: devnet           -> Profile::name
//       rpc: https://...        -> Profile::rpcUrl
//       active: true            -> Profile::active
//   keystore:                   sequence, may be empty or absent
//     - alias: main             -> Identity::alias
//       public_key: <base64>    -> Identity::publicKey + curve (from the flag byte)
//       active: true            -> Identity::active
//
// Address is derived from the key on load and never written: the client
// tool computes it itself.
//
// Unknown keys are kept as QVariant trees (scalars as QString, `~` as a null
// QVariant) and re-emitted after the known keys of the same mapping.
//

#include "ConfigFormatAdapter.h"

class ClientConfigAdapter : public ConfigFormatAdapter
{
public:
    DocumentFormat format() const override { return DocumentFormat::ClientYaml; }

    bool parse(const QByteArray &bytes, ConfigDocument *out,
               ConfigError *err = nullptr) const override;

    bool serialize(const ConfigDocument &doc, QByteArray *out,
                   ConfigError *err = nullptr) const override;
};
