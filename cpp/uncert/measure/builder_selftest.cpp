/*
  Fragment 3.8 - Builder Selftest

  Checks:
    1) append / extend keep the scalar-vs-array distinction.
    2) set / erase keep centers and uncertainties the same length.
    3) build() yields immutable values that render as expected.

  Non-zero return code indicates failure.
*/

#include "uncert/core/selftest.hpp"
#include "uncert/measure/builder.hpp"

namespace uncert {
namespace {

using numeric::Array;
using selftest::Harness;

Measurement sample_array() {
  return Measurement(Array{0.0, 1.0, 2.0, 3.0, 4.0}, Array{0.1, 0.14, 0.18, 0.22, 0.26});
}

void test_measurement_growth(Harness& t) {
  MeasurementBuilder b;
  t.expect_true(b.empty(), "new builder is empty");
  b.append(Measurement(1.0, 0.1)).append(Measurement(2.0, 0.2));
  t.expect_eq_str(b.build().to_string(), "[1.00 ± 0.10, 2.0 ± 0.2]", "append two scalars");

  b.extend(sample_array());
  t.expect_eq_int(static_cast<long long>(b.size()), 7, "extend concatenates");
  t.expect_eq_str(b.at(6).to_string(), "4.0 ± 0.3", "extended element");

  t.expect_throws_code([&b] { b.append(sample_array()); }, ErrorCode::kShapeMismatch,
                       "append of an array-form measurement");
  t.expect_throws_code([&b] { b.extend(Measurement(1.0, 0.1)); }, ErrorCode::kShapeMismatch,
                       "extend with a scalar-form measurement");
  t.expect_throws_code([] { MeasurementBuilder s(Measurement(1.0, 0.1)); },
                       ErrorCode::kShapeMismatch, "cannot seed from a scalar measurement");
}

void test_measurement_edit(Harness& t) {
  MeasurementBuilder b(sample_array());
  b.erase(0);
  t.expect_eq_int(static_cast<long long>(b.size()), 4, "erase shrinks");
  t.expect_eq_str(b.at(0).to_string(), "1.00 ± 0.14", "erase shifts later elements");

  b.set(0, 5.0, 0.5);
  t.expect_eq_str(b.at(0).to_string(), "5.0 ± 0.5", "set by center and uncertainty");
  b.set(1, Measurement(7.0, 0.7));
  t.expect_eq_str(b.at(1).to_string(), "7.0 ± 0.7", "set by measurement");

  t.expect_throws_code([&b] { b.erase(4); }, ErrorCode::kOutOfRange, "erase past the end");
  t.expect_throws_code([&b] { b.set(9, 1.0, 0.1); }, ErrorCode::kOutOfRange, "set past the end");
  t.expect_throws_code([&b] { (void)b.at(4); }, ErrorCode::kOutOfRange, "at past the end");
  t.expect_throws_code([&b] { b.set(0, sample_array()); }, ErrorCode::kShapeMismatch,
                       "set with an array-form measurement");

  const Measurement built = b.build();
  t.expect_true(built.size() == built.uncert().size(), "built lengths agree");

  MeasurementBuilder shared(Measurement(Array{1.0, 2.0}, 0.5));
  shared.append(Measurement(3.0, 0.1));
  const Measurement m = shared.build();
  t.expect_true(m.uncert().is_array() && m.uncert().size() == 3,
                "broadcast uncertainty materializes per element");
  t.expect_eq_str(m.to_string(), "[1.0 ± 0.5, 2.0 ± 0.5, 3.00 ± 0.10]", "mixed uncertainties");

  const Measurement empty = MeasurementBuilder().build();
  t.expect_true(empty.is_array() && empty.size() == 0, "empty build is an empty array");
  t.expect_eq_str(empty.to_string(), "[]", "empty rendering");
}

void test_uncertainty_builder(Harness& t) {
  UncertaintyBuilder b;
  b.append(Uncertainty(0.1)).extend(Uncertainty(Array{0.2, 0.3}));
  t.expect_eq_int(static_cast<long long>(b.size()), 3, "append + extend");
  t.expect_eq_str(b.build().to_string(), "[0.10, 0.2, 0.3]", "built rendering");

  b.set(1, Uncertainty(0.5));
  t.expect_near(b.at(1).to_double(), 0.5, "set");
  b.erase(0);
  t.expect_near(b.at(0).to_double(), 0.5, "erase");

  t.expect_throws_code([&b] { b.append(Uncertainty(Array{1.0})); }, ErrorCode::kShapeMismatch,
                       "append of an array-form uncertainty");
  t.expect_throws_code([&b] { b.extend(Uncertainty(1.0)); }, ErrorCode::kShapeMismatch,
                       "extend with a scalar-form uncertainty");
  t.expect_throws_code([&b] { b.erase(5); }, ErrorCode::kOutOfRange, "erase past the end");
  t.expect_throws_code([] { UncertaintyBuilder s(Uncertainty(1.0)); }, ErrorCode::kShapeMismatch,
                       "cannot seed from a scalar uncertainty");

  UncertaintyBuilder seeded(Uncertainty(Array{1.0, 2.0}));
  t.expect_eq_int(static_cast<long long>(seeded.size()), 2, "seeded from an array");
}

}  // namespace
}  // namespace uncert

int main() {
  using namespace uncert;
  selftest::Harness t("builder");

  test_measurement_growth(t);
  test_measurement_edit(t);
  test_uncertainty_builder(t);

  return t.finish();
}
