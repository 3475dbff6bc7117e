#include "test_harness.h"
#include "test_utils.h"

#include <vector>

#include "jpx/jpx.h"

namespace {

const char* kStore = R"({
  "store": {
    "book": [
      {"category": "reference", "author": "Nigel Rees", "title": "Sayings", "price": 8.95},
      {"category": "fiction", "author": "Evelyn Waugh", "title": "Sword", "price": 12.99},
      {"category": "fiction", "author": "Herman Melville", "title": "Moby Dick",
       "isbn": "0-553-21311-3", "price": 8.99}
    ],
    "bicycle": {"color": "red", "price": 19.95}
  }
})";

jpx::Value query(const std::string& document, const std::string& path) {
  return jpx::from_json(document, path);
}

void test_matcher_root() {
  expect_json(query("{\"a\":1}", "$"), "[{\"a\":1}]", "$ matches the document itself");
  expect_json(query("null", "$"), "[null]", "$ on null still matches once");
}

void test_matcher_keys_and_wildcards() {
  expect_json(query(kStore, "$.store.bicycle.color"), "[\"red\"]", "dotted keys");
  expect_json(query(kStore, "$['store']['bicycle']['price']"), "[19.95]", "bracket keys");
  expect_json(query(kStore, "$.store.book[*].author"),
              "[\"Nigel Rees\",\"Evelyn Waugh\",\"Herman Melville\"]", "wildcard over array");
  expect_json(query("{\"x\":1,\"y\":[2],\"z\":{}}", "$.*"), "[1,[2],{}]",
              "wildcard over object keeps key order");
  expect_true(query(kStore, "$.store.missing").is_null(), "missing key yields null");
  expect_true(query("{\"a\":5}", "$.a.b").is_null(), "key on a scalar yields null");
  expect_true(query("{\"a\":5}", "$.a[*]").is_null(), "wildcard on a scalar yields null");
}

void test_matcher_indexes() {
  expect_json(query("[10,20,30]", "$[0]"), "[10]", "first index");
  expect_json(query("[10,20,30]", "$[-1]"), "[30]", "negative index counts from end");
  expect_true(query("[10,20,30]", "$[3]").is_null(), "index past the end yields null");
  expect_true(query("[10,20,30]", "$[-4]").is_null(), "negative index before start yields null");
  expect_true(query("{\"0\":1}", "$[0]").is_null(), "index on object yields null");
}

void test_matcher_slices() {
  const char* arr = "[0,1,2,3,4]";
  expect_json(query(arr, "$[1:4:2]"), "[1,3]", "stepped slice");
  expect_json(query(arr, "$[::-1]"), "[4,3,2,1,0]", "reverse slice");
  expect_json(query(arr, "$[-3:]"), "[2,3,4]", "tail slice");
  expect_json(query(arr, "$[:2]"), "[0,1]", "head slice");
  expect_json(query(arr, "$[-100:100]"), "[0,1,2,3,4]", "bounds clamp");
  expect_json(query(arr, "$[3:0:-1]"), "[3,2,1]", "negative step with bounds");
  expect_true(query(arr, "$[::0]").is_null(), "zero step selects nothing");
  expect_true(query(arr, "$[4:1]").is_null(), "empty range yields null");
  expect_true(query("{\"a\":1}", "$[0:1]").is_null(), "slice on object yields null");
}

void test_matcher_slice_extreme_steps() {
  const char* arr = "[0,1,2,3,4]";
  expect_json(query(arr, "$[1::9223372036854775807]"), "[1]",
              "step past the end selects only the start");
  expect_json(query(arr, "$[-2::-9223372036854775807]"), "[3]",
              "negative step past the front selects only the start");
  expect_json(query(arr, "$[::4]"), "[0,4]", "step landing on the last element");
  expect_json(query(arr, "$[4:0:-9223372036854775807]"), "[4]", "large negative step with end");
  expect_json(query(arr, "$[::-9223372036854775808]"), "[4]", "most negative step");
}

void test_matcher_recursive_descent_order() {
  expect_json(query(kStore, "$..author"),
              "[\"Nigel Rees\",\"Evelyn Waugh\",\"Herman Melville\"]", "descent finds all authors");
  expect_json(query(kStore, "$..price"), "[8.95,12.99,8.99,19.95]",
              "descent visits in pre-order document order");
  expect_json(query("{\"name\":1,\"c\":{\"name\":2,\"d\":[{\"name\":3}]},\"e\":{\"name\":4}}",
                    "$..name"),
              "[1,2,3,4]", "parent matches before children");
  expect_json(query("{\"a\":[1]}", "$..*"), "[{\"a\":[1]},[1],1]",
              "descent wildcard includes the starting node");
}

void test_matcher_descent_then_index() {
  expect_json(query(kStore, "$..book[2].title"), "[\"Moby Dick\"]", "descent then index");
  expect_json(query(kStore, "$..book[-1:].price"), "[8.99]", "descent then slice");
}

void test_matcher_filters() {
  expect_json(query(kStore, "$.store.book[?(@.price < 10)].title"),
              "[\"Sayings\",\"Moby Dick\"]", "numeric filter");
  expect_json(query(kStore, "$..book[?(@.isbn)].author"), "[\"Herman Melville\"]",
              "existence filter");
  expect_json(query(kStore, "$..book[?(@.category == 'fiction' && @.price > 10)].title"),
              "[\"Sword\"]", "conjunctive filter");
  expect_json(query("{\"a\":{\"v\":1},\"b\":{\"v\":2}}", "$[?(@.v > 1)]"), "[{\"v\":2}]",
              "filter over object values");
  expect_true(query(kStore, "$.store.book[?(@.price > 100)]").is_null(),
              "filter with no matches yields null");
}

void test_matcher_deep_document() {
  const int depth = 2000;
  std::string doc;
  for (int i = 0; i < depth; ++i) doc += "{\"a\":";
  doc += "\"leaf\"";
  for (int i = 0; i < depth; ++i) doc += "}";
  jpx::Value leaves = query(doc, "$..a");
  expect_true(leaves.is_array(), "descent over deep document produces an array");
  expect_eq(leaves.is_array() ? leaves.size() : 0, depth, "every level matched");
  jpx::Value deepest = query(doc, "$..*");
  expect_true(deepest.is_array() && deepest.back() == jpx::Value("leaf"),
              "pre-order ends at the innermost leaf");
}

void test_matcher_invalid_inputs() {
  expect_true(query("{\"a\":", "$.a").is_null(), "malformed json yields null");
  expect_true(query("{\"a\":1}", "$.").is_null(), "malformed path yields null");
  expect_true(query("{\"a\":1}", "a").is_null(), "path without $ yields null");
}

void test_query_value_on_parsed_document() {
  jpx::Value doc = jpx::parse_json_or_null("{\"items\":[{\"id\":1},{\"id\":2}]}");
  expect_json(jpx::query_value(doc, "$.items[*].id"), "[1,2]", "query on parsed value");
  expect_true(jpx::query_value(doc, "$[").is_null(), "bad path on parsed value");
}

}  // namespace

void register_matcher_tests(std::vector<TestCase>& tests) {
  tests.push_back({"matcher_root", test_matcher_root});
  tests.push_back({"matcher_keys_and_wildcards", test_matcher_keys_and_wildcards});
  tests.push_back({"matcher_indexes", test_matcher_indexes});
  tests.push_back({"matcher_slices", test_matcher_slices});
  tests.push_back({"matcher_slice_extreme_steps", test_matcher_slice_extreme_steps});
  tests.push_back({"matcher_recursive_descent_order", test_matcher_recursive_descent_order});
  tests.push_back({"matcher_descent_then_index", test_matcher_descent_then_index});
  tests.push_back({"matcher_filters", test_matcher_filters});
  tests.push_back({"matcher_deep_document", test_matcher_deep_document});
  tests.push_back({"matcher_invalid_inputs", test_matcher_invalid_inputs});
  tests.push_back({"query_value_on_parsed_document", test_query_value_on_parsed_document});
}
