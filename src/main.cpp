/*
 * chaincfg — Sui client configuration editor
 *
 * Copyright (c) 2025 Timo Erkvaara / CPUNK
 *
 * Licensed under the Apache License, Version 2.0
 * http://www.apache.org/licenses/LICENSE-2.0
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QJsonObject>
#include <QTextStream>

#include <cstdio>

#include "AppSettings.h"
#include "AuditLogger.h"
#include "ConfigError.h"
#include "ConfigFormatAdapter.h"
#include "DocumentController.h"
#include "EditSession.h"
#include "KeyMaterialGenerator.h"
#include "Logger.h"
#include "MutationEngine.h"

// main.cpp
// --------
// Headless front end over DocumentController.
//
// Responsibilities:
// - Create QCoreApplication and set org/app name (QSettings + QStandardPaths layout)
// - Parse the command line (QCommandLineParser)
// - Install logging + audit logging (session id, session start event)
// - Run exactly one command: load -> one EditSession commit -> save
//
// Exit codes:
//   0 success, 1 reported error ("chaincfg: <category>: <message>"), 2 usage error
//
// For client documents the <group> argument is "-".

static const char* kApp = "chaincfg";

static QString tr(const char *s)
{
    return QCoreApplication::translate("chaincfg", s);
}

static int report(const ConfigError& e)
{
    const QString line = QString("%1: %2: %3")
                             .arg(QLatin1String(kApp),
                                  errorCategoryName(errorCategory(e.code)),
                                  e.toString());
    std::fprintf(stderr, "%s\n", line.toUtf8().constData());
    return 1;
}

static int usageError(const QString& msg)
{
    std::fprintf(stderr, "%s: %s\n%s\n", kApp, msg.toUtf8().constData(),
                 tr("Try 'chaincfg --help' for more information.").toUtf8().constData());
    return 2;
}

static QString scopeArg(const QString& s)
{
    return (s == "-") ? QString() : s;
}

// -----------------------------
// Command table
// -----------------------------
struct CommandEntry {
    const char* name;
    int         args;      // positional arguments after the command name
    const char* synopsis;
};

static const CommandEntry kCommands[] = {
    { "new",               1, "new <path> [--format json|toml|yaml] [--graphql-group] [--grpc-group]" },
    { "show",              1, "show <path>" },
    { "convert",           2, "convert <in> <out>" },
    { "add-group",         2, "add-group <path> <name> [--active]" },
    { "rename-group",      3, "rename-group <path> <old> <new>" },
    { "activate-group",    2, "activate-group <path> <name>" },
    { "delete-group",      2, "delete-group <path> <name>" },
    { "add-profile",       4, "add-profile <path> <group> <name> <url> [--graphql U] [--grpc U] [--active]" },
    { "set-profile",       5, "set-profile <path> <group> <name> <field> <value>" },
    { "activate-profile",  3, "activate-profile <path> <group> <name>" },
    { "delete-profile",    3, "delete-profile <path> <group> <name>" },
    { "add-identity",      3, "add-identity <path> <group> <alias> [--curve C] [--words N] [--path P] [--active]" },
    { "rename-identity",   4, "rename-identity <path> <group> <old> <new>" },
    { "activate-identity", 3, "activate-identity <path> <group> <alias>" },
    { "delete-identity",   3, "delete-identity <path> <group> <alias>" },
    { "keygen",            0, "keygen [--curve C] [--words N] [--path P]" },
};

static const CommandEntry* findCommand(const QString& name)
{
    for (const auto& c : kCommands)
        if (name == QLatin1String(c.name)) return &c;
    return nullptr;
}

static QString commandSummary()
{
    QString out = tr("Commands:") + "\n";
    for (const auto& c : kCommands)
        out += "  " + QString::fromLatin1(c.synopsis) + "\n";
    out += "\n" + tr("For client (YAML) documents pass '-' as <group>.");
    return out;
}

// -----------------------------
// Output
// -----------------------------
static QString activeMark(bool active)
{
    return active ? QStringLiteral("  [active]") : QString();
}

static void printProfile(QTextStream& out, const Profile& p, const QString& indent, const QString& label)
{
    out << indent << label << " " << p.name << "  " << p.rpcUrl << activeMark(p.active) << "\n";
    if (!p.graphqlUrl.isEmpty()) out << indent << "    graphql: " << p.graphqlUrl << "\n";
    if (!p.grpcUrl.isEmpty())    out << indent << "    grpc:    " << p.grpcUrl << "\n";
}

static void printIdentity(QTextStream& out, const Identity& id, const QString& indent, const QString& label)
{
    out << indent << label << " " << id.alias << "  " << curveToString(id.curve)
        << "  " << id.address << activeMark(id.active) << "\n";
}

static void printDocument(const ConfigDocument& doc)
{
    QTextStream out(stdout);

    out << doc.filePath << " (" << formatToString(doc.format) << ")\n";

    if (doc.isClient()) {
        for (const auto& p : doc.client.environments) printProfile(out, p, "", "environment");
        for (const auto& k : doc.client.keys)         printIdentity(out, k, "", "key");
        return;
    }

    if (!doc.primary.version.isEmpty())
        out << "version " << doc.primary.version << "\n";

    for (const auto& g : doc.primary.groups) {
        out << "group " << g.name << activeMark(g.active) << "\n";
        for (const auto& p : g.profiles)    printProfile(out, p, "  ", "profile");
        for (const auto& id : g.identities) printIdentity(out, id, "  ", "identity");
    }
}

// -----------------------------
// Commands
// -----------------------------
static bool curveOption(const QCommandLineParser& parser, const QString& optName,
                        KeyCurve* out, ConfigError* err)
{
    if (!parser.isSet(optName)) {
        *out = AppSettings::defaultCurve();
        return true;
    }

    const QString tag = parser.value(optName);
    *out = curveFromString(tag);
    if (*out == KeyCurve::Unknown)
        return failWith(err, ErrorCode::UnsupportedCurve,
                        tr("Unsupported curve '%1' (expected ed25519, secp256k1 or secp256r1)").arg(tag));
    return true;
}

static bool keyGenOptions(const QCommandLineParser& parser, KeyGenOptions* out, ConfigError* err)
{
    if (parser.isSet("words")) {
        bool ok = false;
        out->wordCount = parser.value("words").toInt(&ok);
        if (!ok)
            return failWith(err, ErrorCode::InvalidKeyParameters,
                            tr("--words expects a number, got '%1'").arg(parser.value("words")));
    }
    out->derivationPath = parser.value("path");
    return true;
}

// Recovery material is printed once and goes nowhere else.
static void printRecovery(QTextStream& out, const QString& alias, const QString& phrase, const QString& path)
{
    if (phrase.isEmpty()) return;
    out << "recovery phrase for " << alias << " (" << path << "):\n"
        << "    " << phrase << "\n";
}

static int runKeygen(const QCommandLineParser& parser)
{
    ConfigError err;
    KeyCurve curve = KeyCurve::Ed25519;
    if (!curveOption(parser, "curve", &curve, &err)) return report(err);

    KeyGenOptions options;
    if (!keyGenOptions(parser, &options, &err)) return report(err);

    KeyMaterial km;
    if (!KeyMaterialGenerator::generate(curve, options, &km, &err)) return report(err);

    QTextStream out(stdout);
    out << "curve:      " << curveToString(km.curve) << "\n"
        << "public_key: " << KeyMaterialGenerator::encodePublicKey(km.curve, km.publicKey) << "\n"
        << "address:    " << km.address << "\n"
        << "path:       " << km.derivationPath << "\n"
        << "phrase:     " << km.recoveryPhrase << "\n";
    return 0;
}

static int runNew(DocumentController& ctl, const QCommandLineParser& parser, const QString& path)
{
    DocumentFormat format = AppSettings::defaultFormat();
    if (parser.isSet("format")) {
        if (!formatFromString(parser.value("format"), &format))
            return usageError(tr("Unknown format '%1'").arg(parser.value("format")));
    } else if (!ConfigFormatAdapter::formatForExtension(path, &format)) {
        format = AppSettings::defaultFormat();
    }

    ConfigError err;

    // The file name decides how the file is read back.
    DocumentFormat byExt = format;
    if (ConfigFormatAdapter::formatForExtension(path, &byExt) && isPrimaryFormat(byExt) != isPrimaryFormat(format)) {
        failWith(&err, ErrorCode::ExtensionMismatch,
                 tr("%1 is a %2 file name; use a matching extension for a %3 document")
                     .arg(path, formatToString(byExt), formatToString(format)),
                 path);
        return report(err);
    }

    NewDocumentDefaults defaults = AppSettings::newDocumentDefaults();
    defaults.setupGraphql = parser.isSet("graphql-group");
    defaults.setupGrpc = parser.isSet("grpc-group");
    ctl.setNewDocumentDefaults(defaults);

    if (!ctl.newDocument(format, &err)) return report(err);
    if (!ctl.saveAs(path, &err)) return report(err);

    AppSettings::addRecentFile(path);
    printDocument(ctl.document());

    QTextStream out(stdout);
    for (const AppliedChange& c : ctl.seededIdentities()) {
        const QString who = c.scope.isEmpty() ? c.subject : c.scope + "/" + c.subject;
        printRecovery(out, who, c.recoveryPhrase, c.derivationPath);
    }
    return 0;
}

static int runShow(DocumentController& ctl, const QString& path)
{
    ConfigError err;
    if (!ctl.load(path, &err)) return report(err);

    AppSettings::addRecentFile(path);
    printDocument(ctl.document());
    return 0;
}

static int runConvert(DocumentController& ctl, const QString& in, const QString& outPath)
{
    DocumentFormat target = DocumentFormat::PrimaryJson;
    if (!ConfigFormatAdapter::formatForExtension(outPath, &target) || !isPrimaryFormat(target))
        return usageError(tr("convert writes .json or .toml files"));

    ConfigError err;
    if (!ctl.load(in, &err)) return report(err);

    if (ctl.document().isClient()) {
        failWith(&err, ErrorCode::UnsupportedCommand,
                 tr("Only primary documents can be converted between JSON and TOML"), in);
        return report(err);
    }

    if (!ctl.saveAs(outPath, &err)) return report(err);

    AppSettings::addRecentFile(outPath);
    QTextStream(stdout) << in << " -> " << outPath << " (" << formatToString(ctl.document().format) << ")\n";
    return 0;
}

// Builds the mutation for an editing command. args[0] is the path.
static bool buildCommand(const QString& name, const QStringList& args,
                         const QCommandLineParser& parser, MutationCommand* cmd,
                         ConfigError* err, QString* usage)
{
    const bool active = parser.isSet("active");

    if (name == "add-group")        { *cmd = MutationCommand::addGroup(args[1], active); return true; }
    if (name == "rename-group")     { *cmd = MutationCommand::renameGroup(args[1], args[2]); return true; }
    if (name == "activate-group")   { *cmd = MutationCommand::setGroupActive(args[1]); return true; }
    if (name == "delete-group")     { *cmd = MutationCommand::deleteGroup(args[1]); return true; }

    const QString scope = scopeArg(args[1]);

    if (name == "add-profile") {
        *cmd = MutationCommand::addProfile(scope, args[2], args[3],
                                           parser.value("graphql"), parser.value("grpc"), active);
        return true;
    }
    if (name == "set-profile") {
        ProfileField field = ProfileField::Name;
        if (!profileFieldFromString(args[3], &field)) {
            *usage = tr("Unknown profile field '%1' (name, rpc_url, graphql_url, grpc_url)").arg(args[3]);
            return false;
        }
        *cmd = MutationCommand::editProfileField(scope, args[2], field, args[4]);
        return true;
    }
    if (name == "activate-profile") { *cmd = MutationCommand::setProfileActive(scope, args[2]); return true; }
    if (name == "delete-profile")   { *cmd = MutationCommand::deleteProfile(scope, args[2]); return true; }

    if (name == "add-identity") {
        KeyCurve curve = KeyCurve::Ed25519;
        if (!curveOption(parser, "curve", &curve, err)) return false;
        KeyGenOptions options;
        if (!keyGenOptions(parser, &options, err)) return false;
        *cmd = MutationCommand::addIdentity(scope, args[2], curve, active,
                                            options.wordCount, options.derivationPath);
        return true;
    }
    if (name == "rename-identity")   { *cmd = MutationCommand::editIdentityAlias(scope, args[2], args[3]); return true; }
    if (name == "activate-identity") { *cmd = MutationCommand::setIdentityActive(scope, args[2]); return true; }
    if (name == "delete-identity")   { *cmd = MutationCommand::deleteIdentity(scope, args[2]); return true; }

    *usage = tr("Unknown command '%1'").arg(name);
    return false;
}

static int runEdit(DocumentController& ctl, const QString& name, const QStringList& args,
                   const QCommandLineParser& parser)
{
    MutationCommand cmd;
    ConfigError err;
    QString usage;
    if (!buildCommand(name, args, parser, &cmd, &err, &usage))
        return usage.isEmpty() ? report(err) : usageError(usage);

    if (!ctl.load(args[0], &err)) return report(err);

    MutationResult r;
    {
        EditSession session;
        if (!ctl.beginEdit(&session, &err)) return report(err);
        if (!session.stage(cmd, &err)) return report(err);
        r = session.commit();
    }
    if (!r.ok) return report(r.error);

    if (!ctl.save(&err)) return report(err);
    AppSettings::addRecentFile(args[0]);

    QTextStream out(stdout);
    out << name << ": " << r.change.subject;
    if (!r.change.previous.isEmpty() && r.change.previous != r.change.subject)
        out << " (was " << r.change.previous << ")";
    if (!r.change.promoted.isEmpty())
        out << "; " << r.change.promoted << " is now active";
    out << "\n";
    printRecovery(out, r.change.subject, r.change.recoveryPhrase, r.change.derivationPath);
    return 0;
}

// Program entry point.
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Stable names: they select the QSettings file and QStandardPaths folders.
    QCoreApplication::setOrganizationName("chaincfg");
    QCoreApplication::setApplicationName("chaincfg");
    QCoreApplication::setApplicationVersion("0.9.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(tr("Edit Sui client configuration files.") + "\n\n" + commandSummary());
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOptions({
        { { "f", "format" },  tr("Document format for 'new': json, toml or yaml."), "format" },
        { "active",           tr("Make the added entity active.") },
        { "graphql",          tr("GraphQL endpoint for 'add-profile'."), "url" },
        { "grpc",             tr("gRPC endpoint for 'add-profile'."), "url" },
        { { "c", "curve" },   tr("Key curve: ed25519, secp256k1 or secp256r1."), "curve" },
        { "words",            tr("Recovery phrase length: 12, 15, 18, 21 or 24 words."), "count" },
        { "path",             tr("Derivation path, e.g. m/44'/784'/0'/0'/0'."), "path" },
        { "graphql-group",    tr("'new' also creates a group of GraphQL profiles.") },
        { "grpc-group",       tr("'new' also creates a group of gRPC profiles.") },
        { { "v", "verbose" }, tr("Debug logging, mirrored to stderr.") },
        { "log-file",         tr("Write the log to this file."), "path" },
        { "audit-dir",        tr("Write audit events to this directory."), "dir" },
    });

    parser.addPositionalArgument("command", tr("Command to run (see above)."));
    parser.addPositionalArgument("args", tr("Command arguments."), "[args...]");

    if (!parser.parse(QCoreApplication::arguments()))
        return usageError(parser.errorText());
    if (parser.isSet("help"))
        parser.showHelp(0);
    if (parser.isSet("version"))
        parser.showVersion();

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty())
        return usageError(tr("No command given"));

    const QString name = positional.takeFirst();
    const CommandEntry* entry = findCommand(name);
    if (!entry)
        return usageError(tr("Unknown command '%1'").arg(name));
    if (positional.size() != entry->args)
        return usageError(tr("Usage: chaincfg %1").arg(QString::fromLatin1(entry->synopsis)));

    // Logging: command line beats settings.
    const bool verbose = parser.isSet("verbose");
    Logger::setLogLevel(verbose ? 2 : AppSettings::logLevel());
    Logger::setEchoToStderr(verbose);

    const QString logFile = parser.isSet("log-file") ? parser.value("log-file") : AppSettings::logFilePath();
    if (!logFile.isEmpty())
        Logger::setLogFilePathOverride(logFile);
    Logger::install(kApp);

    const QString auditDir = parser.isSet("audit-dir") ? parser.value("audit-dir") : AppSettings::auditDirPath();
    if (!auditDir.isEmpty())
        AuditLogger::setAuditDirOverride(auditDir);
    AuditLogger::install(kApp);
    AuditLogger::setSessionId(AuditLogger::newSessionId());

    QJsonObject start;
    start.insert("command", name);
    AuditLogger::writeEvent("session.start", start);

    qDebug().noquote() << "Running" << name << positional.join(' ');

    DocumentController ctl;
    int rc = 0;

    if (name == "keygen")       rc = runKeygen(parser);
    else if (name == "new")     rc = runNew(ctl, parser, positional[0]);
    else if (name == "show")    rc = runShow(ctl, positional[0]);
    else if (name == "convert") rc = runConvert(ctl, positional[0], positional[1]);
    else                        rc = runEdit(ctl, name, positional, parser);

    QJsonObject end;
    end.insert("command", name);
    end.insert("exit_code", rc);
    AuditLogger::writeEvent("session.end", end);

    return rc;
}
