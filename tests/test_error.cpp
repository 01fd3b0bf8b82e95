// tests/test_error.cpp
// Tests for tf_runner::Error and tf_runner::Status
//
// Framework: doctest
//
// These tests cover:
// - Error: construction, accessors, kind/source taxonomy
// - Factory methods: one per ErrorKind, plus TensorFlow
// - what() message formatting
// - Status: RAII handle, throw_if_error tagging

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "tf_runner/error.hpp"
#include "tf_runner/status.hpp"

#include <stdexcept>
#include <string>
#include <utility>

using namespace tf_runner;

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("Error - full constructor") {
    Error err(ErrorSource::Runner, ErrorKind::Configuration, TF_INVALID_ARGUMENT,
        "TestContext", "test message", "op_name", 42);

    CHECK(err.source() == ErrorSource::Runner);
    CHECK(err.kind() == ErrorKind::Configuration);
    CHECK(err.code() == TF_INVALID_ARGUMENT);
    CHECK(err.context() == "TestContext");
    CHECK(err.message() == "test message");
    CHECK(err.op_name() == "op_name");
    CHECK(err.index() == 42);
}

TEST_CASE("Error - is a std::runtime_error") {
    try {
        throw Error::Execution(TF_INTERNAL, "ctx", "boom");
    } catch (const std::runtime_error& e) {
        CHECK(std::string(e.what()).find("boom") != std::string::npos);
    }
}

// ============================================================================
// Factories
// ============================================================================

TEST_CASE("Error::TensorFlow carries the engine code and the work kind") {
    auto err = Error::TensorFlow(ErrorKind::AssetLoad, TF_INVALID_ARGUMENT, "import", "bad proto");

    CHECK(err.source() == ErrorSource::TensorFlow);
    CHECK(err.kind() == ErrorKind::AssetLoad);
    CHECK(err.code() == TF_INVALID_ARGUMENT);
    CHECK(err.op_name().empty());
    CHECK(err.index() == -1);
}

TEST_CASE("Error::AssetLoad") {
    auto err = Error::AssetLoad("ModelAsset::Load", "file is empty");
    CHECK(err.source() == ErrorSource::Runner);
    CHECK(err.kind() == ErrorKind::AssetLoad);
    CHECK(err.code() == TF_INVALID_ARGUMENT);
}

TEST_CASE("Error::Configuration with op and index") {
    auto err = Error::Configuration(TF_OUT_OF_RANGE, "ctx", "bad layer", "logits", 3);
    CHECK(err.kind() == ErrorKind::Configuration);
    CHECK(err.op_name() == "logits");
    CHECK(err.index() == 3);
}

TEST_CASE("Error::InvalidLabelData") {
    auto err = Error::InvalidLabelData("LabelTable::Parse", "malformed");
    CHECK(err.kind() == ErrorKind::InvalidLabelData);
    CHECK(std::string(err.kind_name()) == "InvalidLabelData");
}

TEST_CASE("Error::IndexOutOfRange reports index and bound") {
    auto err = Error::IndexOutOfRange("LabelTable::class_name", 7, 3);
    CHECK(err.kind() == ErrorKind::IndexOutOfRange);
    CHECK(err.code() == TF_OUT_OF_RANGE);
    CHECK(err.index() == 7);
    CHECK(err.message() == "index 7 outside [0, 3)");
}

// ============================================================================
// Accessors and what()
// ============================================================================

TEST_CASE("Error - code_name") {
    auto err = Error::Execution(TF_DEADLINE_EXCEEDED, "ctx", "msg");
    CHECK(std::string(err.code_name()) == "DEADLINE_EXCEEDED");
}

TEST_CASE("Error - location is populated") {
    auto err = Error::Execution(TF_OK, "ctx", "msg");
    auto loc = err.location();
    CHECK(loc.line() > 0);
    CHECK(loc.file_name() != nullptr);
}

TEST_CASE("Error - what() for runner errors") {
    auto err = Error::Configuration(TF_INVALID_ARGUMENT, "ModelRunner::prepare", "bad backend");
    std::string what = err.what();

    CHECK(what.find("[Configuration/INVALID_ARGUMENT]") == 0);
    CHECK(what.find("ModelRunner::prepare") != std::string::npos);
    CHECK(what.find("bad backend") != std::string::npos);
}

TEST_CASE("Error - what() marks TensorFlow codes") {
    auto err = Error::TensorFlow(ErrorKind::Execution, TF_INTERNAL, "TF_SessionRun", "oops");
    std::string what = err.what();
    CHECK(what.find("[Execution/TF_INTERNAL]") == 0);
}

TEST_CASE("Error - what() includes op and index") {
    auto err = Error::Execution(TF_NOT_FOUND, "ctx", "msg", "softmaxLayer", 0);
    std::string what = err.what();
    CHECK(what.find("op 'softmaxLayer:0'") != std::string::npos);
}

TEST_CASE("Error - what() without context") {
    auto err = Error::Execution(TF_UNKNOWN, "", "message only");
    std::string what = err.what();
    CHECK(what.find("[Execution/UNKNOWN] at ") == 0);
}

TEST_CASE("code_to_string - unknown value") {
    CHECK(std::string(code_to_string(static_cast<TF_Code>(9999))) == "UNKNOWN_CODE");
}

// ============================================================================
// Status
// ============================================================================

TEST_CASE("Status - default is OK and does not throw") {
    Status st;
    CHECK(st.ok());
    CHECK(static_cast<bool>(st));
    CHECK_NOTHROW(st.throw_if_error(ErrorKind::Execution, "ctx"));
}

TEST_CASE("Status - throw_if_error tags source and kind") {
    Status st;
    st.set(TF_NOT_FOUND, "no such op");

    try {
        st.throw_if_error(ErrorKind::AssetLoad, "TF_GraphImportGraphDef");
        FAIL("expected throw");
    } catch (const Error& e) {
        CHECK(e.source() == ErrorSource::TensorFlow);
        CHECK(e.kind() == ErrorKind::AssetLoad);
        CHECK(e.code() == TF_NOT_FOUND);
        CHECK(e.message() == "no such op");
        CHECK(e.context() == "TF_GraphImportGraphDef");
    }
}

TEST_CASE("Status - reset clears the error") {
    Status st;
    st.set(TF_INTERNAL, "x");
    CHECK_FALSE(st.ok());
    st.reset();
    CHECK(st.ok());
}

TEST_CASE("Status - move transfers the handle") {
    Status s1;
    auto* handle = s1.get();
    Status s2(std::move(s1));
    CHECK(s2.get() == handle);
}
