#include <bai2_parser.hpp>
#include <bai2_csv.hpp>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace bai2;

namespace {

const char* kSampleFile =
    "01,BANKUS33,ACMEAR,250115,0800,1,80,1,2/\n"
    "02,ACMEAR,021000021,1,250114,2359,USD,2/\n"
    "03,123456789,USD,010,500000,,,015,750000,,/\n"
    "16,165,150000,0,BR123,CR456,ACME CORP PAY\n"
    "88,MENT FOR INV 1001/\n"
    "16,495,20000,0,BR124,,WIRE OUT/\n"
    "49,1270000,5/\n"
    "98,1270000,1,7/\n"
    "99,1270000,1,9/\n";

} // namespace

class ParserTest : public ::testing::Test {
protected:
    Parser parser;

    File parseOk(const std::string& content) {
        File f;
        ParseError err;
        EXPECT_TRUE(parser.parse_string(content, f, &err)) << err.message;
        return f;
    }

    // one group, one account, one transaction carrying `memo`
    static std::string singleTxn(const std::string& memoLines) {
        return "01,SND,RCV,250115,0800,,,,2/\n"
               "02,RCV,ORIG,1,250114,1200,USD,2/\n"
               "03,42,,/\n" +
               memoLines +
               "49,100,3/\n"
               "98,100,1,5/\n"
               "99,100,1,7/\n";
    }
};

// --- line pre-processing ---

TEST_F(ParserTest, SplitLines_DropsBlankLinesAndLineEndings) {
    auto lines = split_lines("01,A/\r\n\r\n   \n02,B/\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "01,A/");
    EXPECT_EQ(lines[1], "02,B/");
}

TEST_F(ParserTest, JoinContinuations_StripsTerminatorOfPreviousRecord) {
    auto merged = join_continuations({ "16,165,100,0,,,HELLO /", "88,WORLD/", "49,100,2/" });
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0], "16,165,100,0,,,HELLO WORLD/");
    EXPECT_EQ(merged[1], "49,100,2/");
}

TEST_F(ParserTest, SplitFields_StripsTerminatorAndTrailingSeparators) {
    auto f = split_fields("03,123,USD,010,500,,,/");
    ASSERT_EQ(f.size(), 5u);
    EXPECT_EQ(f[0], "03");
    EXPECT_EQ(f[4], "500");
}

TEST_F(ParserTest, FieldReader_MissingPositionYieldsDefault) {
    FieldReader r(split_fields("16,165/"));
    EXPECT_EQ(r.at(1), "165");
    EXPECT_EQ(r.at(5), "");
    EXPECT_EQ(r.at(5, "x"), "x");
    EXPECT_EQ(r.type(), RecordType::Transaction);
}

TEST_F(ParserTest, RecordType_KnownAndUnknownTags) {
    EXPECT_EQ(record_type("01"), RecordType::FileHeader);
    EXPECT_EQ(record_type("88"), RecordType::Continuation);
    EXPECT_EQ(record_type("99/"), RecordType::FileTrailer);
    EXPECT_EQ(record_type("17"), RecordType::Unknown);
    EXPECT_EQ(record_type(""), RecordType::Unknown);
}

// --- hierarchy ---

TEST_F(ParserTest, Parse_SampleFile_BuildsTree) {
    File f = parseOk(kSampleFile);

    EXPECT_EQ(f.senderId, "BANKUS33");
    EXPECT_EQ(f.receiverId, "ACMEAR");
    EXPECT_EQ(f.creationDate, "250115");
    EXPECT_EQ(f.creationTime, "0800");
    EXPECT_EQ(f.resendIndicator, "1");
    EXPECT_EQ(f.recordSize, "80");
    EXPECT_EQ(f.blockingFactor, "1");
    EXPECT_EQ(f.version, "2");

    ASSERT_EQ(f.groups.size(), 1u);
    const Group& g = f.groups[0];
    EXPECT_EQ(g.ultimateReceiverId, "ACMEAR");
    EXPECT_EQ(g.originatorId, "021000021");
    EXPECT_EQ(g.status, "1");
    EXPECT_EQ(g.asOfDate, "250114");
    EXPECT_EQ(g.asOfTime, "2359");
    EXPECT_EQ(g.currency, "USD");
    EXPECT_EQ(g.asOfDateModifier, "2");

    ASSERT_EQ(g.accounts.size(), 1u);
    const Account& a = g.accounts[0];
    EXPECT_EQ(a.customerAccount, "123456789");
    ASSERT_EQ(a.balances.size(), 2u);
    EXPECT_EQ(a.balances[0].typeCode, "010");
    EXPECT_EQ(a.balances[0].amount, "500000");
    EXPECT_EQ(a.balances[1].typeCode, "015");
    EXPECT_EQ(a.balances[1].amount, "750000");

    ASSERT_EQ(a.transactions.size(), 2u);
    EXPECT_EQ(a.transactions[0].typeCode, "165");
    EXPECT_EQ(a.transactions[0].amount, "150000");
    EXPECT_EQ(a.transactions[0].bankRef, "BR123");
    EXPECT_EQ(a.transactions[0].customerRef, "CR456");
    EXPECT_EQ(a.transactions[0].text, "ACME CORP PAYMENT FOR INV 1001");
    EXPECT_EQ(a.transactions[1].text, "WIRE OUT");

    EXPECT_TRUE(f.orphanAccounts.empty());
    EXPECT_TRUE(f.orphanTransactions.empty());
}

TEST_F(ParserTest, Parse_Trailers_SetFieldsAndPresenceFlags) {
    File f = parseOk(kSampleFile);
    const Account& a = f.groups[0].accounts[0];

    EXPECT_TRUE(a.trailer.hasTrailer);
    EXPECT_EQ(a.trailer.controlTotal, "1270000");
    EXPECT_EQ(a.trailer.recordCount, "5");

    EXPECT_TRUE(f.groups[0].trailer.hasTrailer);
    EXPECT_EQ(f.groups[0].trailer.childCount, "1");
    EXPECT_EQ(f.groups[0].trailer.recordCount, "7");

    EXPECT_TRUE(f.trailer.hasTrailer);
    EXPECT_EQ(f.trailer.controlTotal, "1270000");
    EXPECT_EQ(f.trailer.childCount, "1");
    EXPECT_EQ(f.trailer.recordCount, "9");
}

TEST_F(ParserTest, Parse_TruncatedFile_LeavesTrailersEmpty) {
    File f = parseOk("01,S,R,250115,0800/\n02,R,O,1,250114/\n03,1,USD/\n16,165,100/\n");
    ASSERT_EQ(f.groups.size(), 1u);
    EXPECT_FALSE(f.trailer.hasTrailer);
    EXPECT_FALSE(f.groups[0].trailer.hasTrailer);
    EXPECT_FALSE(f.groups[0].accounts[0].trailer.hasTrailer);
    EXPECT_EQ(f.groups[0].accounts[0].trailer.recordCount, "");
    EXPECT_EQ(f.groups[0].accounts[0].transactions.size(), 1u);
}

TEST_F(ParserTest, Parse_ZeroGroups_IsValid) {
    File f = parseOk("01,S,R,250115,0800/\n99,0,0,2/\n");
    EXPECT_TRUE(f.groups.empty());
    EXPECT_TRUE(f.trailer.hasTrailer);
}

TEST_F(ParserTest, Parse_AccountHeaderWithoutBalances) {
    File f = parseOk("01,S,R/\n02,R,O,1,250114/\n03,777/\n");
    ASSERT_EQ(f.groups[0].accounts.size(), 1u);
    EXPECT_EQ(f.groups[0].accounts[0].customerAccount, "777");
    EXPECT_EQ(f.groups[0].accounts[0].currency, "");
    EXPECT_TRUE(f.groups[0].accounts[0].balances.empty());
}

TEST_F(ParserTest, Parse_BalanceWithEmptyTypeCode_IsDropped) {
    File f = parseOk("01,S,R/\n02,R,O/\n03,1,USD,,100,,,040,200,3,Z/\n");
    const auto& b = f.groups[0].accounts[0].balances;
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].typeCode, "040");
    EXPECT_EQ(b[0].itemCount, "3");
    EXPECT_EQ(b[0].fundsType, "Z");
}

TEST_F(ParserTest, Parse_MemoWithCommas_IsRejoined) {
    File f = parseOk(singleTxn("16,165,100,0,BR,CR,ACME, INC. PAYMENT/\n"));
    EXPECT_EQ(f.groups[0].accounts[0].transactions[0].text, "ACME, INC. PAYMENT");
}

TEST_F(ParserTest, Parse_UnknownRecordsAreIgnored) {
    File f = parseOk(singleTxn("XX,garbage/\n16,165,100,0,,,OK/\n17,nothing/\n"));
    ASSERT_EQ(f.groups[0].accounts[0].transactions.size(), 1u);
    EXPECT_EQ(f.groups[0].accounts[0].transactions[0].text, "OK");
}

TEST_F(ParserTest, Parse_LeadingContinuationIsIgnored) {
    File f = parseOk("88,stray/\n01,S,R/\n");
    EXPECT_EQ(f.senderId, "S");
}

// --- context snapshot ---

TEST_F(ParserTest, SingleTransaction_ContextEqualsAncestorHeaders) {
    File f = parseOk(kSampleFile);
    const Group& g = f.groups[0];
    const Account& a = g.accounts[0];
    const TransactionContext& c = a.transactions[0].context;

    EXPECT_EQ(c.accountId, a.customerAccount);
    EXPECT_EQ(c.currency, a.currency);
    EXPECT_EQ(c.asOfDate, g.asOfDate);
    EXPECT_EQ(c.asOfTime, g.asOfTime);
    EXPECT_EQ(c.asOfDateModifier, g.asOfDateModifier);
    EXPECT_EQ(c.bankId, g.originatorId);
    EXPECT_EQ(c.customerId, g.ultimateReceiverId);
    EXPECT_EQ(c.fileDate, f.creationDate);
    EXPECT_EQ(c.fileTime, f.creationTime);
}

TEST_F(ParserTest, Context_CurrencyFallsBackToGroup) {
    File f = parseOk(singleTxn("16,165,100,0,,,X/\n"));
    EXPECT_EQ(f.groups[0].accounts[0].currency, "");
    EXPECT_EQ(f.groups[0].accounts[0].transactions[0].context.currency, "USD");
}

// --- continuation associativity ---

TEST_F(ParserTest, Continuations_AnyChunkingRebuildsSameMemo) {
    const std::string memo = "ACME CORPORATION REMITTANCE FOR INVOICES 1001 1002 AND 1003";

    auto memoFor = [&](std::size_t chunk) {
        std::string lines = "16,165,100,0,BR,CR," + memo.substr(0, chunk) + "/\n";
        for (std::size_t pos = chunk; pos < memo.size(); pos += chunk)
            lines += "88," + memo.substr(pos, chunk) + "/\n";
        File f = parseOk(singleTxn(lines));
        return f.groups[0].accounts[0].transactions[0].text;
    };

    for (std::size_t chunk : { memo.size(), std::size_t(1), std::size_t(7), std::size_t(10), std::size_t(33) })
        EXPECT_EQ(memoFor(chunk), memo) << "chunk " << chunk;
}

TEST_F(ParserTest, Continuation_KeepsTrailingSpaceOfUnterminatedRecord) {
    File f = parseOk("01,S,R/\n02,R,O,1,250114/\n03,1,USD/\n16,165,100,0,,,ACME \n88,CORP/\n");
    EXPECT_EQ(f.groups[0].accounts[0].transactions[0].text, "ACME CORP");
}

TEST_F(ParserTest, Continuation_ChunksSplitAfterSpaces) {
    File f = parseOk(singleTxn("16,165,100,0,BR,CR,PAYMENT \r\n88,FROM \r\n88,ACME CORP/\r\n"));
    EXPECT_EQ(f.groups[0].accounts[0].transactions[0].text, "PAYMENT FROM ACME CORP");
}

TEST_F(ParserTest, Continuation_DropsPaddingAfterTerminator) {
    File f = parseOk(singleTxn("16,165,100,0,BR,CR,ACME /      \n88,CORP/    \n"));
    EXPECT_EQ(f.groups[0].accounts[0].transactions[0].text, "ACME CORP");
}

TEST_F(ParserTest, SplitLines_KeepsTrailingBlanks) {
    auto lines = split_lines("16,165,1,0,,,A \r\n88,B/\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "16,165,1,0,,,A ");
}

TEST_F(ParserTest, Continuation_ExtendsAccountHeaderBalances) {
    File f = parseOk("01,S,R/\n02,R,O/\n03,1,USD,010,100,,/\n88,015,200,,/\n");
    const auto& b = f.groups[0].accounts[0].balances;
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(b[1].typeCode, "015");
    EXPECT_EQ(b[1].amount, "200");
}

// --- orphans ---

TEST_F(ParserTest, Orphans_CollectedInBuckets) {
    File f = parseOk(
        "01,S,R,250115,0800/\n"
        "03,999,USD/\n"
        "16,165,100,0,,,ORPHAN ACCOUNT TXN/\n"
        "49,100,2/\n"
        "16,165,200,0,,,LOOSE/\n"
        "02,R,ORIG,1,250114,,USD/\n"
        "03,111/\n"
        "16,399,300,0,,,IN GROUP/\n"
        "99,600,1,7/\n");

    ASSERT_EQ(f.orphanAccounts.size(), 1u);
    EXPECT_EQ(f.orphanAccounts[0].customerAccount, "999");
    ASSERT_EQ(f.orphanAccounts[0].transactions.size(), 1u);
    EXPECT_TRUE(f.orphanAccounts[0].trailer.hasTrailer);
    EXPECT_EQ(f.orphanAccounts[0].transactions[0].context.accountId, "");

    ASSERT_EQ(f.orphanTransactions.size(), 1u);
    EXPECT_EQ(f.orphanTransactions[0].text, "LOOSE");

    ASSERT_EQ(f.groups.size(), 1u);
    ASSERT_EQ(f.groups[0].accounts[0].transactions.size(), 1u);
    EXPECT_EQ(f.groups[0].accounts[0].transactions[0].context.currency, "USD");
    EXPECT_FALSE(f.groups[0].trailer.hasTrailer);
}

TEST_F(ParserTest, Orphans_GroupHeaderClosesDanglingAccount) {
    File f = parseOk(
        "01,S,R/\n"
        "02,R,O1/\n"
        "03,A/\n"
        "02,R,O2/\n"
        "16,165,100,0,,,AFTER NEW GROUP/\n");
    ASSERT_EQ(f.groups.size(), 2u);
    EXPECT_TRUE(f.groups[0].accounts[0].transactions.empty());
    EXPECT_TRUE(f.groups[1].accounts.empty());
    ASSERT_EQ(f.orphanTransactions.size(), 1u);
}

TEST_F(ParserTest, Orphans_ExcludedFromProjections) {
    File f = parseOk("01,S,R/\n16,165,100,0,,,LOOSE/\n02,R,O/\n03,1,USD/\n16,165,200/\n");
    EXPECT_EQ(transaction_rows(f).size(), 2u); // header + 1
}

// --- errors ---

TEST_F(ParserTest, Error_EmptyInput) {
    File f;
    ParseError err;
    EXPECT_FALSE(parser.parse_string("", f, &err));
    EXPECT_EQ(err.code, ParseErrc::EmptyInput);

    EXPECT_FALSE(parser.parse_string("\r\n  \n\t\n", f, &err));
    EXPECT_EQ(err.code, ParseErrc::EmptyInput);
}

TEST_F(ParserTest, Error_MissingFileHeader_LeavesOutputUntouched) {
    File f;
    f.senderId = "keep";
    ParseError err;
    EXPECT_FALSE(parser.parse_string("02,R,O/\n03,1,USD/\n16,165,100/\n", f, &err));
    EXPECT_EQ(err.code, ParseErrc::MissingFileHeader);
    EXPECT_FALSE(err.message.empty());
    EXPECT_EQ(f.senderId, "keep");
    EXPECT_TRUE(f.groups.empty());
}

TEST_F(ParserTest, Error_NullErrorPointerIsAllowed) {
    File f;
    EXPECT_FALSE(parser.parse_string("", f));
}

TEST_F(ParserTest, Error_MissingFile) {
    File f;
    ParseError err;
    EXPECT_FALSE(parser.parse_file(std::string("/nonexistent/dir/file.bai"), f, &err));
    EXPECT_EQ(err.code, ParseErrc::IoError);
}

// --- input variants ---

TEST_F(ParserTest, Parse_BomAndCrlf) {
    std::string crlf;
    for (const char* p = kSampleFile; *p; ++p) {
        if (*p == '\n') crlf += "\r\n";
        else crlf += *p;
    }
    File f = parseOk("\xEF\xBB\xBF" + crlf);
    EXPECT_EQ(f.senderId, "BANKUS33");
    EXPECT_EQ(f.groups[0].accounts[0].transactions[0].text, "ACME CORP PAYMENT FOR INV 1001");
    EXPECT_EQ(f.trailer.recordCount, "9");
}

TEST_F(ParserTest, Parse_FromStream) {
    std::istringstream is(kSampleFile);
    File f;
    ParseError err;
    ASSERT_TRUE(parser.parse_file(is, f, &err)) << err.message;
    EXPECT_EQ(f.groups[0].accounts[0].transactions.size(), 2u);
}

TEST_F(ParserTest, Parse_IsIdempotent) {
    File a = parseOk(kSampleFile);
    File b = parseOk(kSampleFile);
    EXPECT_EQ(balance_rows(a), balance_rows(b));
    EXPECT_EQ(transaction_rows(a), transaction_rows(b));
    EXPECT_EQ(transaction_detail_rows(a), transaction_detail_rows(b));
}
