// =============================================================================
// Weight and Murmur3 Tests
// =============================================================================

#include <gtest/gtest.h>
#include "otree/murmur3.hpp"
#include "otree/row_hash.hpp"
#include "otree/weight.hpp"

#include <cmath>
#include <cstring>

using namespace otree;

class WeightTest : public ::testing::Test {
protected:
    void SetUp() override {
        schema = Schema(std::vector<Field>{{"id", QDataType::Long}, {"name", QDataType::String}, {"score", QDataType::Double}});
    }

    Schema schema;
};

// Published MurmurHash3_x86_32 reference values (no tail bytes involved)
TEST_F(WeightTest, Murmur3ReferenceVectors) {
    EXPECT_EQ(Murmur3::hash_bytes({}, 0), 0);
    EXPECT_EQ(Murmur3::hash_bytes({}, 1), static_cast<int32_t>(0x514E28B7U));
    EXPECT_EQ(Murmur3::hash_string("test", 0), static_cast<int32_t>(0xba6bd213U));
}

// hashInt and hashLong agree with hashing their little-endian bytes
TEST_F(WeightTest, Murmur3IntegerForms) {
    const int32_t value = -123456789;
    uint8_t int_bytes[4];
    uint32_t u32;
    std::memcpy(&u32, &value, sizeof(u32));
    for (int i = 0; i < 4; ++i) int_bytes[i] = static_cast<uint8_t>(u32 >> (8 * i));
    EXPECT_EQ(Murmur3::hash_int(value, 42), Murmur3::hash_bytes(int_bytes, 42));

    const int64_t long_value = 0x0123456789abcdefLL;
    uint8_t long_bytes[8];
    for (int i = 0; i < 8; ++i) long_bytes[i] = static_cast<uint8_t>(static_cast<uint64_t>(long_value) >> (8 * i));
    EXPECT_EQ(Murmur3::hash_long(long_value, 42), Murmur3::hash_bytes(long_bytes, 42));
}

TEST_F(WeightTest, CanonicalFloatingBits) {
    EXPECT_EQ(Murmur3::double_to_long_bits(-0.0), Murmur3::double_to_long_bits(0.0));
    EXPECT_EQ(Murmur3::double_to_long_bits(std::nan("1")), 0x7ff8000000000000LL);
    EXPECT_EQ(Murmur3::float_to_int_bits(1.0f), 0x3f800000);
}

TEST_F(WeightTest, FractionMapping) {
    EXPECT_DOUBLE_EQ(Weight::MinValue.fraction(), 0.0);
    EXPECT_DOUBLE_EQ(Weight::MaxValue.fraction(), 1.0);
    EXPECT_NEAR(Weight(0).fraction(), 0.5, 1e-9);

    EXPECT_EQ(Weight::from_fraction(0.0), Weight::MinValue);
    EXPECT_EQ(Weight::from_fraction(-3.0), Weight::MinValue);
    EXPECT_EQ(Weight::from_fraction(1.0), Weight::MaxValue);
    EXPECT_EQ(Weight::from_fraction(7.0), Weight::MaxValue);
    EXPECT_NEAR(Weight::from_fraction(0.25).fraction(), 0.25, 1e-9);

    EXPECT_LT(Weight::MinValue, Weight(0));
    EXPECT_LT(Weight(0), Weight::MaxValue);
}

TEST_F(WeightTest, RowWeightIsStable) {
    Row row = {int64_t{17}, std::string("alpha"), 2.5};
    Weight first = row_weight(row, schema, {0, 1});
    Weight second = row_weight(row, schema, {0, 1});
    EXPECT_EQ(first, second);

    // Only indexed columns take part
    Row other = row;
    other[2] = 99.0;
    EXPECT_EQ(row_weight(other, schema, {0, 1}), first);

    other[1] = std::string("beta");
    EXPECT_NE(row_weight(other, schema, {0, 1}), first);
}

TEST_F(WeightTest, NullLeavesSeedUnchanged) {
    EXPECT_EQ(hash_value(ColumnValue{}, QDataType::Long, 42), 42);

    Row with_null = {int64_t{5}, ColumnValue{}, 1.0};
    EXPECT_EQ(row_weight(with_null, schema, {0, 1}), row_weight(with_null, schema, {0}));
}

TEST_F(WeightTest, RowWeightsAreUniform) {
    const Weight quarter = Weight::from_fraction(0.25);
    int below = 0;
    const int n = 20000;
    for (int i = 0; i < n; ++i) {
        Row row = {int64_t{i}, std::string("x"), 0.0};
        if (row_weight(row, schema, {0}) < quarter) ++below;
    }
    double share = static_cast<double>(below) / n;
    EXPECT_GT(share, 0.22);
    EXPECT_LT(share, 0.28);
}

TEST_F(WeightTest, IdentityCoversWholeRow) {
    Row a = {int64_t{1}, std::string("a"), 1.0};
    Row b = {int64_t{1}, std::string("a"), 2.0};
    EXPECT_EQ(row_identity(a, schema), row_identity(a, schema));
    EXPECT_NE(row_identity(a, schema), row_identity(b, schema));
}
