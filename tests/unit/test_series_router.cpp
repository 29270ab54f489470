#include "core/SeriesRouter.h"
#include "format/FormatValidator.h"
#include <gtest/gtest.h>
namespace {
std::shared_ptr<const dsc::FormatDescriptor> load(const char* graphs) {
    const QByteArray json = QByteArray(R"({"type": 0, "packet_delimiters": ["\n"], "data_delimiters": ["="],
        "packet_ids": ["t", "v", "w"], "graph_definitions": )") + graphs + "}";
    dsc::FormatDescriptor desc;
    dsc::ConfigError error;
    EXPECT_TRUE(dsc::FormatValidator::parse(json, desc, error)) << error.toString().toStdString();
    return std::make_shared<const dsc::FormatDescriptor>(desc);
}
dsc::ParsedPacket packet(const char* id, const QVariant& value, qint64 t = 0) {
    dsc::ParsedPacket p;
    p.id = id;
    p.value = value;
    p.parse_time_ns = t;
    return p;
}
}
TEST(SeriesRouterTest, IndexModeCountsSamplesPerSeries) {
    dsc::SeriesRouter router(load(R"({"volts": {"y": {"packet_id": "v"}}})"));
    EXPECT_TRUE(router.route(packet("t", 1)).isEmpty());
    for (int i = 0; i < 3; ++i) {
        const auto out = router.route(packet("v", 10 + i));
        ASSERT_EQ(out.size(), 1);
        EXPECT_EQ(out[0].series_id, QString("volts"));
        EXPECT_EQ(out[0].x.toLongLong(), i);
        EXPECT_EQ(out[0].y.toInt(), 10 + i);
    }
    ASSERT_NE(router.series("volts"), nullptr);
    EXPECT_EQ(router.series("volts")->samples.size(), 3);
}
TEST(SeriesRouterTest, TimeModeIsStrictlyIncreasing) {
    dsc::SeriesRouter router(load(R"({"volts": {"x": {"use_time": true}, "y": {"packet_id": "v"}}})"));
    QList<qint64> xs;
    for (int i = 0; i < 5; ++i) xs << router.route(packet("v", i, 1000)).first().x.toLongLong();
    xs << router.route(packet("v", 5, 999)).first().x.toLongLong();
    xs << router.route(packet("v", 6, 2000)).first().x.toLongLong();
    EXPECT_EQ(xs, (QList<qint64>{1000, 1001, 1002, 1003, 1004, 1005, 2000}));
}
TEST(SeriesRouterTest, InlineModeBuffersUntilIndexArrives) {
    dsc::SeriesRouter router(load(R"({"volts": {"x": {"packet_id": "t"}, "y": {"packet_id": "v"}}})"));
    EXPECT_TRUE(router.route(packet("v", 1)).isEmpty());
    EXPECT_TRUE(router.route(packet("v", 2)).isEmpty());
    EXPECT_EQ(router.pendingCount("volts"), 2);
    EXPECT_EQ(router.parkedCount(), 2);
    const auto flushed = router.route(packet("t", QString("100")));
    ASSERT_EQ(flushed.size(), 2);
    EXPECT_EQ(flushed[0].x.toString(), QString("100"));
    EXPECT_EQ(flushed[1].y.toInt(), 2);
    EXPECT_EQ(router.pendingCount("volts"), 0);
    const auto next = router.route(packet("v", 3));
    ASSERT_EQ(next.size(), 1);
    EXPECT_EQ(next[0].x.toString(), QString("100"));
    router.route(packet("t", QString("101")));
    EXPECT_EQ(router.route(packet("v", 4)).first().x.toString(), QString("101"));
}
TEST(SeriesRouterTest, InlineIndexSeenBeforeSeriesExists) {
    dsc::SeriesRouter router(load(R"({"volts": {"x": {"packet_id": "t"}, "y": {"packet_id": "v"}}})"));
    EXPECT_TRUE(router.route(packet("t", QString("5"))).isEmpty());
    EXPECT_TRUE(router.seriesIds().isEmpty());
    const auto out = router.route(packet("v", 9));
    ASSERT_EQ(out.size(), 1);
    EXPECT_EQ(out[0].x.toString(), QString("5"));
}
TEST(SeriesRouterTest, InlineOnOwnPacketUsesItsValue) {
    dsc::SeriesRouter router(load(R"({"self": {"x": {"packet_id": "v"}, "y": {"packet_id": "v"}}})"));
    const auto out = router.route(packet("v", QString("42")));
    ASSERT_EQ(out.size(), 1);
    EXPECT_EQ(out[0].x.toString(), QString("42"));
    EXPECT_EQ(out[0].y.toString(), QString("42"));
}
TEST(SeriesRouterTest, OnePacketFeedsEveryMatchingSeries) {
    dsc::SeriesRouter router(load(R"({"b": {"y": {"packet_id": "v"}}, "a": {"x": {"use_time": true}, "y": {"packet_id": "v"}}})"));
    const auto out = router.route(packet("v", 1, 77));
    ASSERT_EQ(out.size(), 2);
    EXPECT_EQ(router.seriesIds().size(), 2);
    EXPECT_EQ(router.series("a")->samples.first().x.toLongLong(), 77);
    EXPECT_EQ(router.series("b")->samples.first().x.toLongLong(), 0);
}
TEST(SeriesRouterTest, LabelsFollowModeUnlessOverridden) {
    dsc::SeriesRouter router(load(R"({
        "idx": {"y": {"packet_id": "v"}},
        "time": {"title": "T", "x": {"use_time": true}, "y": {"packet_id": "v", "y_axis": "V"}},
        "inl": {"x": {"packet_id": "t"}, "y": {"packet_id": "w"}},
        "over": {"x": {"packet_id": "t", "use_time": true, "x_axis": "Custom"}, "y": {"packet_id": "w"}}
    })"));
    const dsc::GraphLabels idx = router.labels("idx");
    EXPECT_EQ(idx.title, QString("undefined"));
    EXPECT_EQ(idx.x_axis, QString("Packet Idx"));
    EXPECT_EQ(idx.y_axis, QString("undefined"));
    const dsc::GraphLabels time = router.labels("time");
    EXPECT_EQ(time.title, QString("T"));
    EXPECT_EQ(time.x_axis, QString("Time (ns)"));
    EXPECT_EQ(time.y_axis, QString("V"));
    EXPECT_EQ(router.labels("inl").x_axis, QString("t"));
    EXPECT_EQ(router.labels("over").x_axis, QString("Custom"));
}
TEST(SeriesRouterTest, ResetDiscardsSeries) {
    dsc::SeriesRouter router(load(R"({"volts": {"y": {"packet_id": "v"}}})"));
    router.route(packet("v", 1));
    router.reset();
    EXPECT_EQ(router.series("volts"), nullptr);
    EXPECT_EQ(router.route(packet("v", 2)).first().x.toLongLong(), 0);
}
