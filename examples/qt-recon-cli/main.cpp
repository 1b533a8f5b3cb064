/**
 * bai2 recon - version 1.00
 * --------------------------------------------------------
 * BAI2 cash-position parser and open-invoice matcher
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <sstream>
#include <string>
#include <vector>
#include <bai2_parser.hpp>
#include <bai2_csv.hpp>
#include <invoice_parser_pugi.hpp>
#include <invoice_matcher.hpp>

static const int kRunLogMaxEntries = 100;

// One entry of run_log.json, newest first
class RunLog
{
public:
    explicit RunLog(const QString& path)
        : m_path(path)
    {
        m_entry["started_at"] = QDateTime::currentDateTime().toString(Qt::ISODate);
        m_entry["status"] = "error";
        m_entry["error"] = "";
    }

    void set(const char* key, const QJsonValue& v) { m_entry[QLatin1String(key)] = v; }

    void fail(const QString& message)
    {
        m_entry["status"] = "error";
        m_entry["error"] = message;
    }

    void succeed() { m_entry["status"] = "success"; }

    // Prepends the entry; an unreadable or corrupt log is replaced
    bool write()
    {
        m_entry["finished_at"] = QDateTime::currentDateTime().toString(Qt::ISODate);

        QJsonArray entries;
        QFile in(m_path);
        if (in.open(QIODevice::ReadOnly))
        {
            QJsonParseError perr;
            const QJsonDocument doc = QJsonDocument::fromJson(in.readAll(), &perr);
            if (perr.error == QJsonParseError::NoError && doc.isArray())
                entries = doc.array();
            else
                qWarning("Run log %s is corrupt, starting a new one", qUtf8Printable(m_path));
        }

        entries.prepend(m_entry);
        while (entries.size() > kRunLogMaxEntries)
            entries.removeLast();

        QSaveFile out(m_path);
        if (!out.open(QIODevice::WriteOnly))
            return false;
        out.write(QJsonDocument(entries).toJson(QJsonDocument::Indented));
        return out.commit();
    }

private:
    QString m_path;
    QJsonObject m_entry;
};

static bool readAllBytes(const QString& path, QByteArray& out)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return false;
    out = f.readAll();
    return f.error() == QFileDevice::NoError;
}

static bool writeRows(const QString& path, const bai2::ExportData& rows, const bai2::ExportOptions& opt, std::size_t& count)
{
    std::ostringstream os;
    count = bai2::write_csv(rows, os, opt, opt.include_header);
    const std::string data = os.str();

    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly))
        return false;
    if (f.write(data.data(), static_cast<qint64>(data.size())) != static_cast<qint64>(data.size()))
        return false;
    return f.commit();
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("bai2-recon");
    QCoreApplication::setApplicationVersion("1.00");
    qSetMessagePattern("%{time yyyy-MM-ddThh:mm:ss} [%{type}] %{message}");

    QCommandLineParser cli;
    cli.setApplicationDescription("Converts a BAI2 cash-position file to CSV and matches incoming credits against open invoices.");
    cli.addHelpOption();
    cli.addVersionOption();
    cli.addPositionalArgument("bai-file", "BAI2 file to process.");

    QCommandLineOption outDirOpt({"o", "out-dir"}, "Output directory (default: $BAI2_RECON_WORK_DIR, else current dir).", "dir");
    QCommandLineOption invoicesOpt({"i", "invoices"}, "Open invoice list (XML); enables matching.", "xml");
    QCommandLineOption previousOpt({"p", "previous"}, "Previous cash-application CSV; rows found there are not matched again.", "csv");
    QCommandLineOption delimiterOpt({"d", "delimiter"}, "CSV delimiter.", "c", ",");
    QCommandLineOption bomOpt("bom", "Write a UTF-8 BOM.");
    QCommandLineOption titleOpt("account-title", "Account Title column.", "t", "AR Account");
    QCommandLineOption entityOpt("entity", "Entity column.", "e");
    QCommandLineOption minScoreOpt("min-score", "Match acceptance threshold (0-100).", "n", QString::number(bai2::kMinMatchScore));
    QCommandLineOption linkLabelOpt("link-label", "Label of the invoice hyperlink.", "l", "Open invoice");
    QCommandLineOption runLogOpt("run-log", "Run log (default: <out-dir>/run_log.json).", "file");
    cli.addOptions({ outDirOpt, invoicesOpt, previousOpt, delimiterOpt, bomOpt, titleOpt,
                     entityOpt, minScoreOpt, linkLabelOpt, runLogOpt });
    cli.process(app);

    const QStringList args = cli.positionalArguments();
    if (args.size() != 1)
    {
        qCritical("Expected exactly one BAI2 file");
        cli.showHelp(1);
    }
    const QString baiPath = args.first();

    QString outDir = cli.value(outDirOpt);
    if (outDir.isEmpty())
        outDir = qEnvironmentVariable("BAI2_RECON_WORK_DIR", ".");
    if (!QDir().mkpath(outDir))
    {
        qCritical("Cannot create output directory %s", qUtf8Printable(outDir));
        return 1;
    }

    const QString runLogPath = cli.isSet(runLogOpt) ? cli.value(runLogOpt)
                                                    : QDir(outDir).filePath("run_log.json");
    RunLog runLog(runLogPath);
    runLog.set("bai_file", QFileInfo(baiPath).fileName());

    auto failRun = [&](const QString& message) {
        qCritical("%s", qUtf8Printable(message));
        runLog.fail(message);
        if (!runLog.write())
            qWarning("Cannot write run log %s", qUtf8Printable(runLogPath));
        return 1;
    };

    // -------- options --------
    const QString delim = cli.value(delimiterOpt);
    if (delim.size() != 1 || delim.at(0).unicode() > 0x7F)
        return failRun(QString("Invalid delimiter '%1'").arg(delim));

    bool ok = false;
    const int minScore = cli.value(minScoreOpt).toInt(&ok);
    if (!ok || minScore < 0 || minScore > 100)
        return failRun(QString("Invalid --min-score '%1'").arg(cli.value(minScoreOpt)));

    bai2::ExportOptions opt;
    opt.delimiter = delim.at(0).toLatin1();
    opt.write_utf8_bom = cli.isSet(bomOpt);
    opt.account_title = cli.value(titleOpt).toStdString();
    opt.entity = cli.value(entityOpt).toStdString();

    // -------- decode --------
    QByteArray raw;
    if (!readAllBytes(baiPath, raw))
        return failRun(QString("Cannot read BAI2 file %1").arg(baiPath));

    bai2::Parser parser;
    bai2::File file;
    bai2::ParseError err;
    if (!parser.parse_string(std::string_view(raw.constData(), static_cast<size_t>(raw.size())), file, &err))
        return failRun(QString("Parse error: %1").arg(QString::fromStdString(err.message)));

    qInfo("Parsed %s: %d group(s)", qUtf8Printable(baiPath), static_cast<int>(file.groups.size()));
    if (!file.orphanAccounts.empty() || !file.orphanTransactions.empty())
        qWarning("%d account(s) outside a group and %d transaction(s) outside an account were not exported",
                 static_cast<int>(file.orphanAccounts.size()), static_cast<int>(file.orphanTransactions.size()));
    runLog.set("orphan_transactions", static_cast<int>(file.orphanTransactions.size()));

    const QString stem = QFileInfo(baiPath).completeBaseName();
    const QDir dir(outDir);

    // -------- export --------
    const bai2::ExportData balances = bai2::balance_rows(file, opt);
    const bai2::ExportData transactions = bai2::transaction_rows(file, opt);
    const bai2::ExportData details = bai2::transaction_detail_rows(file, opt);

    std::size_t balanceCount = 0, txnCount = 0, detailCount = 0;
    const QString balancesPath = dir.filePath(stem + "_balances.csv");
    const QString transactionsPath = dir.filePath(stem + "_transactions.csv");
    const QString detailsPath = dir.filePath(stem + "_transaction_details.csv");

    if (!writeRows(balancesPath, balances, opt, balanceCount))
        return failRun(QString("Cannot write %1").arg(balancesPath));
    if (!writeRows(transactionsPath, transactions, opt, txnCount))
        return failRun(QString("Cannot write %1").arg(transactionsPath));
    if (!writeRows(detailsPath, details, opt, detailCount))
        return failRun(QString("Cannot write %1").arg(detailsPath));

    qInfo("Wrote %d balance row(s) to %s", static_cast<int>(balanceCount), qUtf8Printable(balancesPath));
    qInfo("Wrote %d transaction row(s) to %s", static_cast<int>(txnCount), qUtf8Printable(transactionsPath));
    if (txnCount == 0)
        qWarning("No transactions in %s", qUtf8Printable(baiPath));

    runLog.set("balance_rows", static_cast<int>(balanceCount));
    runLog.set("transaction_rows", static_cast<int>(txnCount));

    // -------- match --------
    if (cli.isSet(invoicesOpt))
    {
        const QString invoicesPath = cli.value(invoicesOpt);
        QByteArray xml;
        if (!readAllBytes(invoicesPath, xml))
            return failRun(QString("Cannot read invoice list %1").arg(invoicesPath));

        bai2::InvoiceReader reader;
        std::vector<bai2::Invoice> invoices;
        std::string xmlErr;
        if (!reader.parse_string(std::string(xml.constData(), static_cast<size_t>(xml.size())), invoices, &xmlErr))
            return failRun(QString("Invoice list %1: %2").arg(invoicesPath, QString::fromStdString(xmlErr)));

        qInfo("Loaded %d open invoice(s)", static_cast<int>(invoices.size()));
        runLog.set("invoices_loaded", static_cast<int>(invoices.size()));

        bai2::ExportData toMatch = transactions;
        if (cli.isSet(previousOpt))
        {
            const QString previousPath = cli.value(previousOpt);
            QByteArray prevBytes;
            bai2::ExportData previous;
            if (!readAllBytes(previousPath, prevBytes))
                return failRun(QString("Cannot read previous cash application %1").arg(previousPath));
            std::istringstream is(std::string(prevBytes.constData(), static_cast<size_t>(prevBytes.size())));
            if (!bai2::read_csv(is, opt.delimiter, previous))
                return failRun(QString("Malformed CSV %1").arg(previousPath));

            toMatch = bai2::filter_unmatched(transactions, bai2::collect_match_keys(previous, true), opt.include_header);
        }

        const std::size_t newRows = toMatch.size() - (opt.include_header && !toMatch.empty() ? 1 : 0);
        runLog.set("new_rows_to_match", static_cast<int>(newRows));

        bai2::MatchOptions mopt;
        mopt.min_score = minScore;
        mopt.link_label = cli.value(linkLabelOpt).toStdString();

        const bai2::ExportData matched = bai2::match_transactions(toMatch, invoices, opt.include_header, mopt);
        const std::size_t matches = bai2::count_matches(matched, opt.include_header);

        std::size_t cashCount = 0;
        const QString cashPath = dir.filePath(stem + "_cash_application.csv");
        if (!writeRows(cashPath, matched, opt, cashCount))
            return failRun(QString("Cannot write %1").arg(cashPath));

        qInfo("Matched %d of %d new row(s), wrote %s", static_cast<int>(matches), static_cast<int>(newRows), qUtf8Printable(cashPath));
        if (newRows == 0)
            qWarning("No new transactions to match");
        runLog.set("matches_found", static_cast<int>(matches));
    }

    runLog.succeed();
    if (!runLog.write())
        qWarning("Cannot write run log %s", qUtf8Printable(runLogPath));
    return 0;
}
