#pragma once

#include "TestHarness.hpp"
#include "FakeGoalService.hpp"

#include <DatapointTable.hpp>
#include <Reconciler.hpp>

namespace tests {

static const QTimeZone PlusOneHour(3600);

static QByteArray sampleTable() {
    return QByteArrayLiteral("TIMESTAMP\tVALUE\tCOMMENT\tID\n"
                             "2023-11-14 23:13:20\t1.5\twalk\ta\n"
                             "2023-11-15 00:13:20\t2\t\tb\n");
}

static bool tableWritesHeaderAndRowsInLocalTime() {
    QList<Datapoint> datapoints{makeDatapoint(QStringLiteral("a"), 1700000000, 1.5, QStringLiteral("walk")),
                                makeDatapoint(QStringLiteral("b"), 1700003600, 2)};
    EXPECT_EQ(writeDatapointTable(datapoints, PlusOneHour), sampleTable(), "rendered table");
    return true;
}

static bool tableWithoutDatapointsIsJustHeader() {
    EXPECT_EQ(writeDatapointTable({}, PlusOneHour), QByteArrayLiteral("TIMESTAMP\tVALUE\tCOMMENT\tID\n"),
              "empty table");
    auto rows = readDatapointTable(QByteArrayLiteral("TIMESTAMP\tVALUE\tCOMMENT\tID\n"), PlusOneHour);
    EXPECT(rows.has_value(), "header-only table should parse");
    EXPECT(rows->isEmpty(), "header-only table has no rows");
    return true;
}

static bool tableReadsRowsNormalizedToUtc() {
    auto rows = readDatapointTable(sampleTable(), PlusOneHour);
    EXPECT(rows.has_value(), "sample table should parse");
    EXPECT_EQ(rows->size(), 2, "row count");

    const auto& first = rows->at(0);
    EXPECT(first.id == QStringLiteral("a"), "first row ID");
    EXPECT(first.timestamp == QDateTime::fromSecsSinceEpoch(1700000000, QTimeZone::utc()), "first row timestamp");
    EXPECT(first.value == 1.5, "first row value");
    EXPECT(first.comment == QStringLiteral("walk"), "first row comment");
    EXPECT_EQ(first.line, 2, "first row line");

    const auto& second = rows->at(1);
    EXPECT(second.comment == QString(), "empty comment reads as empty string");
    EXPECT_EQ(second.line, 3, "second row line");
    return true;
}

static bool tableRowWithoutIdIsNew() {
    auto rows = readDatapointTable(QByteArrayLiteral("TIMESTAMP\tVALUE\tCOMMENT\tID\n"
                                                     "2023-11-15 08:00:00\t3\tnew\t\n"
                                                     "2023-11-15 09:00:00\t4\n"), PlusOneHour);
    EXPECT(rows.has_value(), "table should parse");
    EXPECT_EQ(rows->size(), 2, "row count");
    EXPECT(!rows->at(0).id.has_value(), "empty ID field means no ID");
    EXPECT(!rows->at(1).id.has_value(), "missing ID field means no ID");
    EXPECT(rows->at(1).comment == QString(), "missing comment field reads as empty string");
    return true;
}

static bool tableToleratesCarriageReturns() {
    auto rows = readDatapointTable(QByteArrayLiteral("TIMESTAMP\tVALUE\tCOMMENT\tID\r\n"
                                                     "2023-11-14 23:13:20\t1.5\twalk\ta\r\n"), PlusOneHour);
    EXPECT(rows.has_value(), "CRLF table should parse");
    EXPECT(rows->at(0).id == QStringLiteral("a"), "ID without trailing carriage return");
    return true;
}

static bool tableMissingValueFailsWholeRead() {
    QString error;
    auto rows = readDatapointTable(QByteArrayLiteral("TIMESTAMP\tVALUE\tCOMMENT\tID\n"
                                                     "2023-11-14 23:13:20\t1.5\twalk\ta\n"
                                                     "2023-11-15 00:13:20\n"), PlusOneHour, &error);
    EXPECT(!rows.has_value(), "a row without value should fail the read");
    EXPECT(error.contains(QStringLiteral("line 3")), "error names the line");
    EXPECT(error.contains(QStringLiteral("2023-11-15 00:13:20")), "error quotes the line");
    return true;
}

static bool tableBlankLineFailsRead() {
    auto rows = readDatapointTable(QByteArrayLiteral("TIMESTAMP\tVALUE\tCOMMENT\tID\n"
                                                     "\n"
                                                     "2023-11-14 23:13:20\t1.5\twalk\ta\n"), PlusOneHour);
    EXPECT(!rows.has_value(), "blank row should fail the read");
    return true;
}

static bool tableBadTimestampOrValueFailsRead() {
    QString error;
    auto rows = readDatapointTable(QByteArrayLiteral("TIMESTAMP\tVALUE\tCOMMENT\tID\n"
                                                     "yesterday\t1\t\ta\n"), PlusOneHour, &error);
    EXPECT(!rows.has_value(), "unparseable timestamp should fail the read");
    EXPECT(error.startsWith(QStringLiteral("Invalid timestamp on line 2")), "timestamp error message");

    rows = readDatapointTable(QByteArrayLiteral("TIMESTAMP\tVALUE\tCOMMENT\tID\n"
                                                "2023-11-14 23:13:20\tlots\t\ta\n"), PlusOneHour, &error);
    EXPECT(!rows.has_value(), "unparseable value should fail the read");
    EXPECT(error.startsWith(QStringLiteral("Invalid value on line 2")), "value error message");
    return true;
}

static bool tableRoundTripReconcilesToNothing() {
    QList<Datapoint> datapoints{makeDatapoint(QStringLiteral("a"), 1700000000, 1.5, QStringLiteral("walk")),
                                makeDatapoint(QStringLiteral("b"), 1700003600, 0.1),
                                makeDatapoint(QStringLiteral("c"), 1700007200, -3.25, QStringLiteral("ran"))};
    auto rows = readDatapointTable(writeDatapointTable(datapoints, PlusOneHour), PlusOneHour);
    EXPECT(rows.has_value(), "written table should parse");
    auto plan = reconcile(datapoints, *rows);
    EXPECT(plan.operations.isEmpty(), "unchanged table needs no operations");
    EXPECT(plan.issues.isEmpty(), "unchanged table has no issues");
    return true;
}

static bool tableRoundTripsAcrossDaylightSavingChange() {
    const QTimeZone newYork(QByteArrayLiteral("America/New_York"));
    // 01:30 happens twice in New York on 2023-11-05: first in EDT, then an hour later in EST
    QList<Datapoint> datapoints{makeDatapoint(QStringLiteral("edt"), 1699162200, 1),
                                makeDatapoint(QStringLiteral("est"), 1699165800, 2),
                                makeDatapoint(QStringLiteral("summer"), 1689000000, 3)};
    auto rows = readDatapointTable(writeDatapointTable(datapoints, newYork), newYork);
    EXPECT(rows.has_value(), "written table should parse");
    EXPECT(rows->at(0).timestamp != rows->at(1).timestamp, "the two 01:30s stay distinct");
    EXPECT(rows->at(1).timestamp == QDateTime::fromSecsSinceEpoch(1699165800, QTimeZone::utc()),
           "the second 01:30 reads back as itself");

    auto plan = reconcile(datapoints, *rows);
    EXPECT(plan.operations.isEmpty(), "unchanged table needs no operations, whatever the season");
    return true;
}

static bool valuesFormatShortestWithoutExponent() {
    EXPECT_EQ(formatValue(2), QStringLiteral("2"), "integral value");
    EXPECT_EQ(formatValue(0.1), QStringLiteral("0.1"), "fractional value");
    EXPECT_EQ(formatValue(-3.25), QStringLiteral("-3.25"), "negative value");
    EXPECT_EQ(formatValue(1500000), QStringLiteral("1500000"), "large value");
    return true;
}

inline void runDatapointTableTests() {
    SUBCAT("Writing");
    RUN_TEST(tableWritesHeaderAndRowsInLocalTime);
    RUN_TEST(tableWithoutDatapointsIsJustHeader);
    RUN_TEST(valuesFormatShortestWithoutExponent);

    SUBCAT("Reading");
    RUN_TEST(tableReadsRowsNormalizedToUtc);
    RUN_TEST(tableRowWithoutIdIsNew);
    RUN_TEST(tableToleratesCarriageReturns);
    RUN_TEST(tableMissingValueFailsWholeRead);
    RUN_TEST(tableBlankLineFailsRead);
    RUN_TEST(tableBadTimestampOrValueFailsRead);
    RUN_TEST(tableRoundTripReconcilesToNothing);
    RUN_TEST(tableRoundTripsAcrossDaylightSavingChange);
}

} // namespace tests
