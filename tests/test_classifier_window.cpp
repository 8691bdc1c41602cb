#include "detection/classifier_window.hpp"

#include <gtest/gtest.h>

TEST(ClassifierWindowTest, CountsStatusClasses) {
  ClassifierWindow window("203.0.113.5", 10000, 0, 8);
  window.add(1000, 401, 10, "/login");
  window.add(2000, 403, 20, "/admin");
  window.add(3000, 404, 30, "/missing");
  window.add(4000, 200, 40, "/login");

  EXPECT_EQ(window.event_count(), 4u);
  EXPECT_EQ(window.status_4xx_count(), 3u);
  EXPECT_EQ(window.status_401_403_count(), 2u);
  EXPECT_EQ(window.bytes_total(), 100u);
  EXPECT_EQ(window.distinct_endpoints(), 3u);
  EXPECT_EQ(window.endpoint_event_count("/login"), 2u);
  EXPECT_EQ(window.now(), 4000u);
}

TEST(ClassifierWindowTest, AuthFailureEndpointsExcludeSuccesses) {
  ClassifierWindow window("k", 5000, 0, 8);
  window.add(1000, 200, 0, "/");
  window.add(1100, 200, 0, "/static/app.js");
  window.add(1200, 401, 0, "/login");
  window.add(1300, 403, 0, "/login");
  EXPECT_EQ(window.distinct_endpoints(), 3u);
  EXPECT_EQ(window.distinct_auth_failure_endpoints(), 1u);

  window.add(6500, 200, 0, "/"); // the /login failures expire
  EXPECT_EQ(window.distinct_auth_failure_endpoints(), 0u);
}

TEST(ClassifierWindowTest, ExpiredEventsAreForgotten) {
  ClassifierWindow window("k", 5000, 0, 8);
  window.add(1000, 401, 100, "/a");
  window.add(2000, 401, 100, "/b");
  window.add(8000, 200, 1, "/c"); // window is now [3000, 8000]

  EXPECT_EQ(window.event_count(), 1u);
  EXPECT_EQ(window.status_401_403_count(), 0u);
  EXPECT_EQ(window.bytes_total(), 1u);
  EXPECT_EQ(window.distinct_endpoints(), 1u);
  EXPECT_EQ(window.window_start(), 3000u);
}

TEST(ClassifierWindowTest, RejectsEventsOlderThanWindow) {
  ClassifierWindow window("k", 5000, 0);
  EXPECT_TRUE(window.add(10000, 200, 0));
  EXPECT_FALSE(window.add(4000, 401, 0));
  EXPECT_TRUE(window.add(6000, 401, 0)); // late but inside
  EXPECT_EQ(window.event_count(), 2u);
  EXPECT_EQ(window.now(), 10000u);
}

TEST(ClassifierWindowTest, EndpointTrackingSaturates) {
  ClassifierWindow window("k", 60000, 0, 2);
  window.add(1, 200, 0, "/a");
  window.add(2, 200, 0, "/b");
  window.add(3, 200, 0, "/c");
  EXPECT_EQ(window.distinct_endpoints(), 2u);
  EXPECT_EQ(window.endpoint_event_count("/c"), 0u);
  EXPECT_EQ(window.event_count(), 3u);
}

TEST(ClassifierWindowTest, EventCapEvictsOldest) {
  ClassifierWindow window("k", 60000, 2);
  window.add(1, 401, 5);
  window.add(2, 200, 5);
  window.add(3, 200, 5);
  EXPECT_EQ(window.event_count(), 2u);
  EXPECT_EQ(window.status_401_403_count(), 0u);
  EXPECT_EQ(window.bytes_total(), 10u);
}

TEST(ClassifierWindowTest, ReconfigureShrinksWindow) {
  ClassifierWindow window("k", 60000, 0);
  window.add(1000, 401, 0);
  window.add(50000, 401, 0);
  window.reconfigure(10000, 0);
  EXPECT_EQ(window.event_count(), 1u);
  EXPECT_EQ(window.window_ms(), 10000u);
}
