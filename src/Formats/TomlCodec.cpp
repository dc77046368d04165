// TomlCodec.cpp
//
// toml++ node <-> QVariant conversion. Integers stay 64-bit in both
// directions; date-times keep their UTC offset when the file has one and
// become local times when it does not.

#include "TomlCodec.h"

#include <QDate>
#include <QDateTime>
#include <QDebug>
#include <QTime>
#include <QVariantList>

#include <toml++/toml.h>

#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace {

QString fromStd(std::string_view s)
{
    return QString::fromUtf8(s.data(), int(s.size()));
}

QDate toQDate(const toml::date &d)
{
    return QDate(d.year, d.month, d.day);
}

QTime toQTime(const toml::time &t)
{
    return QTime(t.hour, t.minute, t.second, int(t.nanosecond / 1000000));
}

QVariant toVariant(const toml::node &node);

QVariantMap tableToVariant(const toml::table &tbl)
{
    QVariantMap m;
    for (auto &&[key, value] : tbl)
        m.insert(fromStd(key.str()), toVariant(value));
    return m;
}

QVariantList arrayToVariant(const toml::array &arr)
{
    QVariantList l;
    for (const toml::node &value : arr)
        l << toVariant(value);
    return l;
}

QVariant toVariant(const toml::node &node)
{
    switch (node.type()) {
        case toml::node_type::table:
            return tableToVariant(*node.as_table());
        case toml::node_type::array:
            return arrayToVariant(*node.as_array());
        case toml::node_type::string:
            return fromStd(node.as_string()->get());
        case toml::node_type::integer:
            return qlonglong(node.as_integer()->get());
        case toml::node_type::floating_point:
            return node.as_floating_point()->get();
        case toml::node_type::boolean:
            return node.as_boolean()->get();
        case toml::node_type::date:
            return toQDate(node.as_date()->get());
        case toml::node_type::time:
            return toQTime(node.as_time()->get());
        case toml::node_type::date_time: {
            const toml::date_time &dt = node.as_date_time()->get();
            if (dt.offset)
                return QDateTime(toQDate(dt.date), toQTime(dt.time),
                                 Qt::OffsetFromUTC, dt.offset->minutes * 60);
            return QDateTime(toQDate(dt.date), toQTime(dt.time), Qt::LocalTime);
        }
        case toml::node_type::none:
            break;
    }
    return QVariant();
}

toml::date fromQDate(const QDate &d)
{
    return toml::date(d.year(), unsigned(d.month()), unsigned(d.day()));
}

toml::time fromQTime(const QTime &t)
{
    return toml::time(unsigned(t.hour()), unsigned(t.minute()), unsigned(t.second()),
                      unsigned(t.msec()) * 1000000u);
}

toml::array arrayFromVariant(const QVariantList &list);
toml::table tableFromVariant(const QVariantMap &map);

// Appends `v` through `sink`, which receives any toml++ value or container.
// Returns false for values with no TOML form.
template <typename Sink>
bool emit(const QVariant &v, Sink &&sink)
{
    switch (v.userType()) {
        case QMetaType::QVariantMap:
            sink(tableFromVariant(v.toMap()));
            return true;
        case QMetaType::QVariantList:
        case QMetaType::QStringList:
            sink(arrayFromVariant(v.toList()));
            return true;
        case QMetaType::QString:
            sink(v.toString().toStdString());
            return true;
        case QMetaType::Bool:
            sink(v.toBool());
            return true;
        case QMetaType::Int:
        case QMetaType::UInt:
        case QMetaType::LongLong:
        case QMetaType::ULongLong:
            sink(int64_t(v.toLongLong()));
            return true;
        case QMetaType::Double:
        case QMetaType::Float:
            sink(v.toDouble());
            return true;
        case QMetaType::QDate:
            sink(fromQDate(v.toDate()));
            return true;
        case QMetaType::QTime:
            sink(fromQTime(v.toTime()));
            return true;
        case QMetaType::QDateTime: {
            const QDateTime dt = v.toDateTime();
            if (dt.timeSpec() == Qt::LocalTime) {
                sink(toml::date_time(fromQDate(dt.date()), fromQTime(dt.time())));
            } else {
                toml::time_offset off;
                off.minutes = int16_t(dt.offsetFromUtc() / 60);
                sink(toml::date_time(fromQDate(dt.date()), fromQTime(dt.time()), off));
            }
            return true;
        }
        default:
            break;
    }
    return false;
}

toml::array arrayFromVariant(const QVariantList &list)
{
    toml::array arr;
    for (const QVariant &v : list) {
        if (!emit(v, [&arr](auto &&value) { arr.push_back(std::forward<decltype(value)>(value)); }))
            qWarning() << "TOML: dropping array element of type" << v.typeName();
    }
    return arr;
}

toml::table tableFromVariant(const QVariantMap &map)
{
    toml::table tbl;
    for (auto it = map.cbegin(); it != map.cend(); ++it) {
        if (it.value().isNull())
            continue;
        const std::string key = it.key().toStdString();
        if (!emit(it.value(), [&tbl, &key](auto &&value) {
                tbl.insert_or_assign(key, std::forward<decltype(value)>(value));
            }))
            qWarning() << "TOML: dropping key" << it.key() << "of type" << it.value().typeName();
    }
    return tbl;
}

} // namespace

namespace TomlCodec {

bool parse(const QByteArray &text, QVariantMap *out, QString *err)
{
    try {
        const toml::table tbl = toml::parse(std::string_view(text.constData(), size_t(text.size())));
        *out = tableToVariant(tbl);
    } catch (const toml::parse_error &e) {
        if (err)
            *err = QString("line %1: %2")
                       .arg(e.source().begin.line)
                       .arg(fromStd(e.description()));
        return false;
    }
    if (err) err->clear();
    return true;
}

QByteArray serialize(const QVariantMap &root)
{
    std::ostringstream os;
    os << tableFromVariant(root) << '\n';
    return QByteArray::fromStdString(os.str());
}

} // namespace TomlCodec
