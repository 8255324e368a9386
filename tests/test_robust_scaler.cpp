#include "vigil/ai/robust_scaler.h"
#include <gtest/gtest.h>

using vigil::ai::RobustScaler;

TEST(RobustScalerTest, PercentileInterpolatesLinearly) {
    EXPECT_DOUBLE_EQ(RobustScaler::percentile({1, 2, 3, 4}, 0.5), 2.5);
    EXPECT_DOUBLE_EQ(RobustScaler::percentile({4, 1, 3, 2}, 0.25), 1.75);
    EXPECT_DOUBLE_EQ(RobustScaler::percentile({7}, 0.75), 7.0);
    EXPECT_DOUBLE_EQ(RobustScaler::percentile({}, 0.5), 0.0);
}

TEST(RobustScalerTest, CentersOnMedianAndScalesByIqr) {
    Eigen::MatrixXd data(5, 2);
    data << 1, 10,
            2, 10,
            3, 10,
            4, 10,
            100, 10;

    RobustScaler scaler;
    scaler.fit({"a:mean", "b:mean"}, data);

    EXPECT_DOUBLE_EQ(scaler.center()[0], 3.0);
    EXPECT_DOUBLE_EQ(scaler.scale()[0], 2.0);
    // Constant column keeps unit scale
    EXPECT_DOUBLE_EQ(scaler.center()[1], 10.0);
    EXPECT_DOUBLE_EQ(scaler.scale()[1], 1.0);

    auto scaled = scaler.transform({5.0, 12.0});
    EXPECT_FLOAT_EQ(scaled[0], 1.0f);
    EXPECT_FLOAT_EQ(scaled[1], 2.0f);
}

TEST(RobustScalerTest, TransformRejectsWrongWidth) {
    RobustScaler scaler({"a", "b"}, {0.0, 0.0}, {1.0, 1.0});
    EXPECT_THROW(scaler.transform({1.0}), std::invalid_argument);
}

TEST(RobustScalerTest, ConstructorRejectsMismatchedParameters) {
    EXPECT_THROW(RobustScaler({"a", "b"}, {0.0}, {1.0, 1.0}), std::invalid_argument);
}

TEST(RobustScalerTest, RestoresFromJson) {
    RobustScaler scaler({"a", "b"}, {1.5, -2.0}, {0.5, 4.0});
    RobustScaler restored = RobustScaler::from_json(scaler.to_json());
    EXPECT_EQ(restored.feature_names(), scaler.feature_names());
    EXPECT_EQ(restored.center(), scaler.center());
    EXPECT_EQ(restored.scale(), scaler.scale());
}
