#include <shotimport/core/contract_validator.hpp>
#include <shotimport/core/stage_contract.hpp>
#include <shotimport/core/stage_payload.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace nc = shotimport::core;
namespace names = shotimport::core::contract_names;

namespace {

nc::ContractValidator make_validator() { return nc::ContractValidator(nc::default_contracts()); }

nc::Record valid_roi() {
  return nc::to_record(nc::RoiResult{nc::Bounds{10.0, 20.0, 300.0, 200.0}, 0.85,
                                     nc::RoiMethod::Edge, "edges"});
}

nc::Record valid_raw_input() {
  nc::RawInput input;
  input.width = 4;
  input.height = 2;
  input.image = std::make_shared<const nc::Image>(4u, 2u, nc::PixelFormat::Grayscale8,
                                                  std::vector<std::byte>(8));
  return nc::to_record(input);
}

}  // namespace

TEST(ContractValidator, AcceptsValidRoiAndDecodes) {
  auto v = make_validator();
  auto result = v.validate(names::kRoiResult, valid_roi());
  ASSERT_TRUE(result.has_value()) << nc::describe(result.error());
  EXPECT_EQ(result->contract(), names::kRoiResult);
  EXPECT_EQ(result->version(), 1u);
  const auto* roi = result->get_if<nc::RoiResult>();
  ASSERT_NE(roi, nullptr);
  EXPECT_DOUBLE_EQ(roi->bounds.width, 300.0);
  EXPECT_EQ(roi->note, "edges");
}

TEST(ContractValidator, UnknownContract) {
  auto v = make_validator();
  auto result = v.validate("price-list", valid_roi());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, nc::ErrorCode::ContractViolation);
  EXPECT_EQ(result.error().message, "unknown contract");
}

TEST(ContractValidator, NestedContractIsNotAStage) {
  auto v = make_validator();
  auto result = v.validate("bounds", nc::to_record(nc::Bounds{0, 0, 1, 1}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message, "not a stage contract");
}

TEST(ContractValidator, MissingSchemaVersion) {
  auto v = make_validator();
  nc::Record r = valid_roi();
  r.erase(nc::kSchemaVersionField);
  auto result = v.validate(names::kRoiResult, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().field, "schema_version");
  EXPECT_EQ(result.error().message, "missing required field");
}

TEST(ContractValidator, SchemaVersionMismatch) {
  auto v = make_validator();
  nc::Record r = valid_roi();
  r.set(std::string(nc::kSchemaVersionField), std::int64_t{2});
  auto result = v.validate(names::kRoiResult, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().field, "schema_version");
  EXPECT_NE(result.error().message.find("version mismatch"), std::string::npos);
}

TEST(ContractValidator, ZeroWidthBoundsRejectedWithFieldPath) {
  auto v = make_validator();
  auto r = nc::to_record(nc::RoiResult{nc::Bounds{0.0, 0.0, 0.0, 10.0}, 0.9, nc::RoiMethod::Edge, {}});
  auto result = v.validate(names::kRoiResult, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().contract, names::kRoiResult);
  EXPECT_EQ(result.error().field, "bounds.width");
  EXPECT_EQ(nc::describe(result.error()),
            "ContractViolation: roi-result.bounds.width: value below minimum (exclusive) 0");
}

TEST(ContractValidator, ConfidenceOutOfRange) {
  auto v = make_validator();
  nc::Record r = valid_roi();
  r.set("confidence", 1.2);
  auto result = v.validate(names::kRoiResult, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().field, "confidence");
}

TEST(ContractValidator, NonFiniteNumberRejected) {
  auto v = make_validator();
  nc::Record r = valid_roi();
  r.set("confidence", std::numeric_limits<double>::quiet_NaN());
  auto result = v.validate(names::kRoiResult, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message, "value is not finite");
}

TEST(ContractValidator, IntegerIsNotANumber) {
  auto v = make_validator();
  nc::Record r = valid_roi();
  r.set("confidence", std::int64_t{1});
  auto result = v.validate(names::kRoiResult, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message, "expected number, got integer");
}

TEST(ContractValidator, EnumMiss) {
  auto v = make_validator();
  nc::Record r = valid_roi();
  r.set("method", std::string("laser"));
  auto result = v.validate(names::kRoiResult, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().field, "method");
}

TEST(ContractValidator, UnexpectedFieldRejected) {
  auto v = make_validator();
  nc::Record r = valid_roi();
  r.set("debug", true);
  auto result = v.validate(names::kRoiResult, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().field, "debug");
  EXPECT_EQ(result.error().message, "unexpected field");
}

TEST(ContractValidator, OptionalFieldMayBeAbsent) {
  auto v = make_validator();
  nc::Record r = valid_roi();
  r.erase("note");
  EXPECT_TRUE(v.validate(names::kRoiResult, r).has_value());
}

TEST(ContractValidator, GridMapNeedsAtLeastOneCell) {
  auto v = make_validator();
  nc::GridMap grid;
  grid.rows = 1;
  grid.cols = 1;
  auto result = v.validate(names::kGridMap, nc::to_record(grid));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().field, "cells");
}

TEST(ContractValidator, ListElementPathIsIndexed) {
  auto v = make_validator();
  nc::RecognitionResult rec;
  rec.items.push_back(nc::DetectedItem{"Shield", 0.9, {}, "r0c0", false, {}});
  rec.items.push_back(nc::DetectedItem{"", 0.9, {}, "r0c1", false, {}});
  auto result = v.validate(names::kRecognitionResult, nc::to_record(rec));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().field, "items[1].name");
}

TEST(ContractValidator, EmptyRecognitionIsValid) {
  auto v = make_validator();
  auto result = v.validate(names::kRecognitionResult, nc::to_record(nc::RecognitionResult{}));
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->get_if<nc::RecognitionResult>()->items.empty());
}

TEST(ContractValidator, RawInputRejectsBrokenImage) {
  auto v = make_validator();
  EXPECT_TRUE(v.validate(names::kRawInput, valid_raw_input()).has_value());

  nc::Record r = valid_raw_input();
  r.set("image", std::make_shared<const nc::Image>(4u, 2u, nc::PixelFormat::Grayscale8,
                                                   std::vector<std::byte>(3)));
  auto result = v.validate(names::kRawInput, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().field, "image");

  r.set("image", nc::ImageHandle{});
  result = v.validate(names::kRawInput, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message, "null image handle");
}

TEST(ContractValidator, RawInputDimensionsMustMatchImage) {
  auto v = make_validator();
  nc::Record r = valid_raw_input();
  r.set("width", std::int64_t{10000});
  auto result = v.validate(names::kRawInput, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, nc::ErrorCode::ContractViolation);
  EXPECT_EQ(result.error().field, "width");

  r = valid_raw_input();
  r.set("height", std::int64_t{3});
  result = v.validate(names::kRawInput, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().field, "height");
}

TEST(ContractValidator, GridCountsAboveUint32AreRejected) {
  auto v = make_validator();
  nc::GridMap grid;
  grid.rows = 1;
  grid.cols = 1;
  grid.cells.push_back(nc::GridCell{"r0c0", 0, 0, nc::Bounds{0, 0, 10, 10}, nc::GridZone::Regular});
  ASSERT_TRUE(v.validate(names::kGridMap, nc::to_record(grid)).has_value());

  nc::Record r = nc::to_record(grid);
  r.set("rows", std::int64_t{4294967297});
  auto result = v.validate(names::kGridMap, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().field, "rows");

  nc::Record cell = nc::to_record(grid).get_if<nc::Record::List>("cells")->front();
  cell.set("col", std::int64_t{4294967296});
  r = nc::to_record(grid);
  r.set("cells", nc::Record::List{cell});
  result = v.validate(names::kGridMap, r);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().field, "cells[0].col");
}

TEST(ContractValidator, ValidationIsRepeatable) {
  auto v = make_validator();
  nc::Record r = valid_roi();
  r.set("confidence", -0.1);
  auto a = v.validate(names::kRoiResult, r);
  auto b = v.validate(names::kRoiResult, r);
  ASSERT_FALSE(a.has_value());
  ASSERT_FALSE(b.has_value());
  EXPECT_EQ(a.error().field, b.error().field);
  EXPECT_EQ(a.error().message, b.error().message);
}
