#include "io/json_reader.hpp"
#include "physics/rigid_body.hpp"
#include "replay/trajectory_writer.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace pursuit;
using namespace pursuit::replay;

namespace {

JsonValue write_and_parse(const TrajectoryWriter& writer, const TrajectoryInfo& info) {
    std::ostringstream out;
    writer.write_json(out, info);
    return JsonReader::parse(out.str());
}

}  // namespace

class TrajectoryWriterTest : public ::testing::Test {
protected:
    SimpleRigidBody missile{Pose{}, 50.0};
    SimpleRigidBody threat{Pose{{10, 0, 0}, Quat::Identity()}, 200.0};
    TrajectoryWriter writer;

    void SetUp() override {
        writer.init({{"missile", &missile}, {"threat_0", &threat}}, 0.5);
    }
};

TEST_F(TrajectoryWriterTest, SamplesAtInterval) {
    EXPECT_TRUE(writer.sample(0.0));
    EXPECT_FALSE(writer.sample(0.2));
    EXPECT_FALSE(writer.sample(0.4));
    EXPECT_TRUE(writer.sample(0.5));
    EXPECT_TRUE(writer.sample(1.25));
    EXPECT_EQ(writer.sample_count(), 3u);
}

TEST_F(TrajectoryWriterTest, FirstCallAlwaysRecords) {
    EXPECT_TRUE(writer.sample(3.7));
    EXPECT_FALSE(writer.sample(3.8));
}

TEST_F(TrajectoryWriterTest, WritesEnuPositionsAndOrientations) {
    missile.move_to(Pose{{1, 2, 3}, Quat::Identity()});
    writer.sample(0.0);

    TrajectoryInfo info{"ep_7", "simulation", "intercept", 0.01};
    JsonValue doc = write_and_parse(writer, info);

    EXPECT_EQ(doc["format"].get_string(), "trajectory_v1");
    EXPECT_EQ(doc["frame"].get_string(), "ENU");
    EXPECT_EQ(doc["run"]["episodeId"].get_string(), "ep_7");
    EXPECT_EQ(doc["run"]["outcome"].get_string(), "intercept");
    EXPECT_DOUBLE_EQ(doc["run"]["dt"].get_number(), 0.01);
    EXPECT_DOUBLE_EQ(doc["timeline"]["sampleInterval"].get_number(), 0.5);

    const JsonValue& agents = doc["agents"];
    ASSERT_EQ(agents.size(), 2u);
    EXPECT_EQ(agents[0]["id"].get_string(), "missile");
    EXPECT_TRUE(agents[0]["endTime"].is_null());

    // Internal (1, 2, 3) is ENU (1, 3, 2)
    Vec3 p;
    ASSERT_TRUE(agents[0]["positions"][0].get_vec3(p));
    EXPECT_DOUBLE_EQ(p.x, 1.0);
    EXPECT_DOUBLE_EQ(p.y, 3.0);
    EXPECT_DOUBLE_EQ(p.z, 2.0);

    std::vector<double> q;
    ASSERT_TRUE(agents[0]["orientations"][0].get_numbers(q, 4));
    EXPECT_NEAR(q[0], 1.0, 1e-12);
    EXPECT_NEAR(q[1], 0.0, 1e-12);
}

TEST_F(TrajectoryWriterTest, EndedAgentHoldsLastPose) {
    writer.sample(0.0);
    writer.record_end("threat_0", 0.2);
    writer.record_end("threat_0", 0.9);
    writer.record_end("nobody", 0.1);

    threat.move_to(Pose{{99, 0, 0}, Quat::Identity()});
    writer.sample(0.5);

    JsonValue doc = write_and_parse(writer, TrajectoryInfo{});
    const JsonValue& th = doc["agents"][1];
    EXPECT_DOUBLE_EQ(th["endTime"].get_number(), 0.2);
    ASSERT_EQ(th["positions"].size(), 2u);
    EXPECT_DOUBLE_EQ(th["positions"][1][0].get_number(), 10.0);
    EXPECT_EQ(doc["summary"]["ended"].get_int(), 1);
}

TEST_F(TrajectoryWriterTest, EventsSortedByTime) {
    writer.sample(0.0);
    writer.record_event({2.0, "DETONATION", "missile", "closest 3.1 m", Vec3{0, 5, 0}});
    writer.record_event({0.0, "SPAWN", "missile", "", Vec3{}});
    writer.record_event({0.0, "SPAWN", "threat_0", "", Vec3{10, 0, 0}});

    JsonValue doc = write_and_parse(writer, TrajectoryInfo{});
    const JsonValue& events = doc["events"];
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0]["agentId"].get_string(), "missile");
    EXPECT_EQ(events[1]["agentId"].get_string(), "threat_0");
    EXPECT_FALSE(events[0].has("detail"));
    EXPECT_EQ(events[2]["type"].get_string(), "DETONATION");
    EXPECT_EQ(events[2]["detail"].get_string(), "closest 3.1 m");
    // Internal (0, 5, 0) is 5 m up
    EXPECT_DOUBLE_EQ(events[2]["position"][1].get_number(), 0.0);
    EXPECT_DOUBLE_EQ(events[2]["position"][2].get_number(), 5.0);
    EXPECT_EQ(doc["summary"]["events"].get_int(), 3);
    EXPECT_EQ(doc["summary"]["samples"].get_int(), 1);
}

TEST_F(TrajectoryWriterTest, InitClearsPreviousRun) {
    writer.sample(0.0);
    writer.record_event({0.0, "SPAWN", "missile", "", Vec3{}});
    writer.init({{"missile", &missile}}, 0.1);

    EXPECT_EQ(writer.sample_count(), 0u);
    JsonValue doc = write_and_parse(writer, TrajectoryInfo{});
    EXPECT_EQ(doc["agents"].size(), 1u);
    EXPECT_EQ(doc["events"].size(), 0u);
    EXPECT_DOUBLE_EQ(doc["timeline"]["endTime"].get_number(), 0.0);
}
