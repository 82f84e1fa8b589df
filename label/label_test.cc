#include "gtest/gtest.h"
#include "label/Label.hpp"

namespace tsdump {
namespace label {

class LabelTest : public testing::Test {};

TEST_F(LabelTest, FromJSON) {
  Labels lset;
  ASSERT_TRUE(lbs_from_json("{}", &lset).ok());
  ASSERT_TRUE(lset.empty());

  ASSERT_TRUE(lbs_from_json(R"({"replica":"1","dc":"eu"})", &lset).ok());
  ASSERT_EQ(2u, lset.size());
  // Document order is kept.
  ASSERT_EQ(Label("replica", "1"), lset[0]);
  ASSERT_EQ(Label("dc", "eu"), lset[1]);

  base::Status s = lbs_from_json("{\"a\":", &lset);
  ASSERT_TRUE(s.IsConfigurationError());
  ASSERT_TRUE(lset.empty());
  ASSERT_TRUE(lbs_from_json("[]", &lset).IsInvalidArgument());
  ASSERT_TRUE(lbs_from_json("\"x\"", &lset).IsInvalidArgument());
  s = lbs_from_json(R"({"a":1})", &lset);
  ASSERT_TRUE(s.IsInvalidArgument());
  ASSERT_NE(std::string::npos, s.ToString().find("a"));
}

TEST_F(LabelTest, SplitValues) {
  ASSERT_TRUE(split_label_values("").empty());
  ASSERT_EQ(std::vector<std::string>({"a"}), split_label_values("a"));
  ASSERT_EQ(std::vector<std::string>({"a", "b", "c"}),
            split_label_values(" a, b,,c , "));
  ASSERT_TRUE(split_label_values(" , ,").empty());
}

TEST_F(LabelTest, Helpers) {
  Labels lset = {Label("b", "2"), Label("a", "1"), Label("b", "1")};
  ASSERT_EQ(R"({b="2",a="1",b="1"})", lbs_string(lset));

  Labels sorted = lbs_sorted_by_name(lset);
  ASSERT_EQ(Label("a", "1"), sorted[0]);
  ASSERT_EQ(Label("b", "2"), sorted[1]);
  ASSERT_EQ(Label("b", "1"), sorted[2]);

  ASSERT_EQ("2", lbs_get(lset, "b"));
  ASSERT_EQ("", lbs_get(lset, "c"));

  ASSERT_EQ(Labels({Label("a", "1"), Label("z", "0")}),
            lbs_from_string({"z", "0", "a", "1"}));
  ASSERT_EQ(Label("", ""), ALL_POSTINGS_KEYS);
  ASSERT_EQ("__name__", METRIC_NAME);
}

}  // namespace label
}  // namespace tsdump

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
