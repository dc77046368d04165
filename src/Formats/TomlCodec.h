#pragma once
//
// TomlCodec.h
//
// PURPOSE
// -------
// Bridges toml++ and the QVariant tree used by the Primary config TOML
// encoding. toml++ does the reading, validation and formatting; this file
// only maps node types:
//
//   table            <-> QVariantMap
//   array of tables  <-> QVariantList of QVariantMap
//   array            <-> QVariantList
//   string           <-> QString
//   integer          <-> qlonglong
//   float            <-> double
//   boolean          <-> bool
//   date / time      <-> QDate / QTime / QDateTime
//
// The same QVariant tree shape comes out of QJsonDocument::toVariant(), so
// the Primary adapter maps both encodings with one schema mapper.
//
// Duplicate keys and table redefinitions are rejected by toml++ at parse time.
//

#include <QByteArray>
#include <QString>
#include <QVariantMap>

namespace TomlCodec {

    // Parses TOML text. On failure returns false and sets *err to
    // "line N: <reason>".
    bool parse(const QByteArray &text, QVariantMap *out, QString *err = nullptr);

    // Serializes a QVariant tree through toml++'s formatter.
    // Null values and variant types with no TOML form are skipped.
    QByteArray serialize(const QVariantMap &root);

} // namespace TomlCodec
