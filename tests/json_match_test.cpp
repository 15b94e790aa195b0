#include "eventtap/core/event/JsonMatch.h"
#include <cassert>

using nlohmann::json;
namespace jm = eventtap::core::event::json_match;

int main(){
    // wildcard, empty and substring expectations
    assert(jm::matches(json("anything"), json("*")));
    assert(jm::matches(json(42), json("*")));
    assert(jm::matches(json(""), json("")));
    assert(!jm::matches(json("x"), json("")));
    assert(jm::matches(json("checkout_button"), json("~button")));
    assert(!jm::matches(json("checkout"), json("~button")));

    // primitives compare by string form against expected strings
    assert(jm::matches(json(42), json("42")));
    assert(jm::matches(json(true), json("true")));
    assert(jm::matches(json(42), json(42)));
    assert(!jm::matches(json(41), json(42)));
    assert(!jm::matches(json("42"), json(42)));

    // objects: subset, recursive
    json actual = {{"screen", "home"}, {"user", {{"id", 7}, {"tier", "gold"}}}, {"extra", 1}};
    assert(jm::matches(actual, json{{"screen", "home"}}));
    assert(jm::matches(actual, json{{"user", {{"tier", "gold"}}}}));
    assert(!jm::matches(actual, json{{"user", {{"tier", "silver"}}}}));
    assert(!jm::matches(actual, json{{"missing", "*"}}));

    // arrays are order agnostic
    json items = json::array({ {{"sku", "A"}}, {{"sku", "B"}} });
    assert(jm::matches(items, json::array({ {{"sku", "B"}} })));
    assert(jm::matches(items, json::array({ {{"sku", "B"}}, {{"sku", "A"}} })));
    assert(!jm::matches(items, json::array({ {{"sku", "C"}} })));

    // serialized JSON inside a string
    json embedded = {{"data", "{\"amount\":10,\"currency\":\"EUR\"}"}};
    assert(jm::matches(embedded, json{{"data", {{"currency", "EUR"}}}}));
    assert(!jm::matches(embedded, json{{"data", {{"currency", "USD"}}}}));

    // depth-first search
    json tree = {{"a", {{"b", json::array({ {{"target", "hit"}} })}}}};
    assert(jm::find_key_value(tree, "target", json("hit")));
    assert(!jm::find_key_value(tree, "target", json("miss")));
    assert(!jm::find_key_value(tree, "nope", json("*")));

    // contains prefers event.data but falls back to the whole payload
    json payload = {{"name", "purchase"}, {"event", {{"data", {{"amount", 10}, {"items", json::array({"x", "y"})}}}}}};
    assert(jm::contains(payload, json{{"amount", 10}}));
    assert(jm::contains(payload, json{{"amount", "10"}, {"name", "purchase"}}));
    assert(jm::contains(payload, json{{"items", json::array({"y"})}}));
    assert(!jm::contains(payload, json{{"amount", 11}}));
    assert(!jm::contains(payload, json("not an object")));

    assert(jm::scalar_string(json("s")) == "s");
    assert(jm::scalar_string(json(1.5)) == "1.5");
    assert(jm::scalar_string(json(nullptr)) == "null");
    return 0;
}
