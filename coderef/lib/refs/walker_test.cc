#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <refs/walker.h>
#include <code/parse_asm.h>

namespace coderef::refs {
namespace {

using ::testing::HasSubstr;

class References : public ::testing::Test {
 protected:
  std::shared_ptr<rt::function> function(std::string name,
                                         std::string_view listing,
                                         std::vector<std::string> cellvars = {},
                                         std::vector<std::string> freevars = {},
                                         std::vector<std::shared_ptr<rt::cell>> closure = {}) {
    auto code = std::make_shared<code::code_object>();
    code->name = name;
    code->filename = "test_code_references.casm";
    code->instructions = code::asm_parse_listing(listing);
    code->cellvars = std::move(cellvars);
    code->freevars = std::move(freevars);
    return rt::make_function(std::move(name), std::move(code), globals, std::move(closure));
  }

  static std::shared_ptr<rt::cell> cell(rt::value v) {
    return std::make_shared<rt::cell>(rt::cell{.contents = std::move(v)});
  }

  std::shared_ptr<rt::klass> klass(std::string name) {
    return std::make_shared<rt::klass>(rt::klass{.name = std::move(name), .attributes = {}});
  }

  reference_list get_references(const rt::value &callable) {
    return references_of(callable, modules, sink);
  }

  std::shared_ptr<rt::dict> globals = std::make_shared<rt::dict>();
  rt::importer modules;
  diag::collecting_sink sink;
};

TEST_F(References, Empty) {
  auto pass = function("x", R"(
    2 LOAD_CONST None
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(pass), reference_list{});

  auto literal = function("x", R"(
    2 LOAD_CONST 42
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(literal), reference_list{});

  // def x(val="42"): return val
  auto parameter = function("x", R"(
    2 LOAD_FAST val
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(parameter), reference_list{});
  EXPECT_TRUE(sink.empty());
}

TEST_F(References, Global) {
  globals->emplace("global_val", 42);
  auto x = function("x", R"(
    2 LOAD_GLOBAL global_val
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(x), reference_list{rt::value(42)});
}

TEST_F(References, FreeVariable) {
  auto x = function("x", R"(
    3 LOAD_DEREF free_val
      RETURN_VALUE
  )", {}, {"free_val"}, {cell("42")});
  EXPECT_EQ(get_references(x), reference_list{rt::value("42")});
}

TEST_F(References, CellVariable) {
  // def x():
  //   cell_val = "42"
  //   def y(): return cell_val
  auto x = function("x", R"(
    2 LOAD_CONST "42"
      STORE_DEREF cell_val
    4 LOAD_CLOSURE cell_val
      BUILD_TUPLE 1
      LOAD_CONST "x.<locals>.y"
      MAKE_FUNCTION 8
      STORE_FAST y
      LOAD_CONST None
      RETURN_VALUE
  )", {"cell_val"});
  EXPECT_EQ(get_references(x), reference_list{partial_name{"cell_val"}});
}

TEST_F(References, Import) {
  const char *listing = R"(
    2 LOAD_CONST 0
      LOAD_CONST None
      IMPORT_NAME pytest
      STORE_FAST pytest
    4 LOAD_FAST pytest
      RETURN_VALUE
  )";
  EXPECT_EQ(get_references(function("x", listing)), reference_list{partial_name{"pytest"}});
  EXPECT_TRUE(sink.empty());

  auto pytest = modules.add("pytest");
  EXPECT_EQ(get_references(function("x", listing)), reference_list{rt::value(pytest)});
}

TEST_F(References, ImportFrom) {
  // from pkg.sub import helper; helper()
  const char *listing = R"(
    2 LOAD_CONST 0
      LOAD_CONST "helper"
      IMPORT_NAME pkg.sub
      IMPORT_FROM helper
      STORE_FAST helper
      POP_TOP
    3 LOAD_FAST helper
      CALL_FUNCTION 0
      RETURN_VALUE
  )";
  EXPECT_EQ(get_references(function("x", listing)), reference_list{partial_name{"pkg.sub.helper"}});

  auto helper = function("helper", "LOAD_CONST None\nRETURN_VALUE");
  modules.add("pkg.sub")->attributes.emplace("helper", helper);
  EXPECT_EQ(get_references(function("x", listing)), reference_list{rt::value(helper)});
  EXPECT_TRUE(sink.empty());
}

TEST_F(References, Function) {
  auto x = function("x", R"(
    2 LOAD_CONST "42"
      RETURN_VALUE
  )");
  globals->emplace("x", x);
  auto y = function("y", R"(
    5 LOAD_GLOBAL x
      CALL_FUNCTION 0
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(y), reference_list{rt::value(x)});

  auto z = function("z", R"(
    8 LOAD_GLOBAL func_does_not_exist
      CALL_FUNCTION 0
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(z), reference_list{partial_name{"func_does_not_exist"}});
}

TEST_F(References, Method) {
  auto my_class = klass("MyClass");
  globals->emplace("MyClass", my_class);
  // my_class = MyClass(); my_class.log_val()
  auto x = function("x", R"(
    2 LOAD_GLOBAL MyClass
      CALL_FUNCTION 0
      STORE_FAST my_class
    3 LOAD_FAST my_class
      LOAD_METHOD log_val
      CALL_METHOD 0
      POP_TOP
      LOAD_CONST None
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(x), (reference_list{rt::value(my_class), partial_name{"log_val"}}));

  // def y(my_class): my_class.log_val()
  auto y = function("y", R"(
    6 LOAD_FAST my_class
      LOAD_METHOD log_val
      CALL_METHOD 0
      POP_TOP
      LOAD_CONST None
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(y), reference_list{partial_name{"log_val"}});
}

TEST_F(References, Class) {
  auto my_class = klass("MyClass");
  auto flow_builder = klass("FlowBuilder");
  globals->emplace("FlowBuilder", flow_builder);

  auto x = function("x", R"(
    2 LOAD_DEREF MyClass
      CALL_FUNCTION 0
      STORE_FAST my_class
    3 LOAD_FAST my_class
      RETURN_VALUE
  )", {}, {"MyClass"}, {cell(my_class)});
  EXPECT_EQ(get_references(x), reference_list{rt::value(my_class)});

  // builder = FlowBuilder(); builder.assign("cls", MyClass); return builder
  auto y = function("y", R"(
    2 LOAD_GLOBAL FlowBuilder
      CALL_FUNCTION 0
      STORE_FAST builder
    3 LOAD_FAST builder
      LOAD_METHOD assign
      LOAD_CONST "cls"
      LOAD_DEREF MyClass
      CALL_METHOD 2
      POP_TOP
    4 LOAD_FAST builder
      RETURN_VALUE
  )", {}, {"MyClass"}, {cell(my_class)});
  EXPECT_EQ(get_references(y),
            (reference_list{rt::value(flow_builder), partial_name{"assign"}, rt::value(my_class)}));
}

TEST_F(References, DottedNameOfUnknownGlobal) {
  auto x = function("x", R"(
    2 LOAD_GLOBAL os
      LOAD_ATTR path
      LOAD_METHOD join
      LOAD_CONST "a"
      CALL_METHOD 1
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(x), reference_list{partial_name{"os.path.join"}});
}

TEST_F(References, AttributeOfKnownGlobal) {
  auto np = modules.add("numpy");
  auto array = function("array", "LOAD_CONST None\nRETURN_VALUE");
  np->attributes.emplace("array", array);
  globals->emplace("np", np);
  auto x = function("x", R"(
    2 LOAD_GLOBAL np
      LOAD_METHOD array
      BUILD_LIST 0
      CALL_METHOD 1
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(x), reference_list{rt::value(array)});
}

TEST_F(References, BoundMethodSeesItsReceiver) {
  auto my_class = klass("MyClass");
  auto obj = std::make_shared<rt::instance>(rt::instance{.cls = my_class, .attributes = {}});
  obj->attributes.emplace("value", "42");
  // def log_val(self): import logging; logging.log(self.value)
  my_class->attributes.emplace("log_val", function("log_val", R"(
    7 LOAD_CONST 0
      LOAD_CONST None
      IMPORT_NAME logging
      STORE_FAST logging
    9 LOAD_FAST logging
      LOAD_METHOD log
      LOAD_FAST self
      LOAD_ATTR value
      CALL_METHOD 1
      POP_TOP
      LOAD_CONST None
      RETURN_VALUE
  )"));

  rt::value bound = rt::getattr(obj, "log_val");
  ASSERT_TRUE(bound.is<std::shared_ptr<rt::bound_method>>());
  EXPECT_EQ(get_references(bound), (reference_list{partial_name{"logging.log"}, rt::value("42")}));

  // unbound, self is just another parameter
  EXPECT_EQ(get_references(my_class->attributes.at("log_val")),
            (reference_list{partial_name{"logging.log"}, partial_name{"value"}}));
  EXPECT_TRUE(sink.empty());
}

TEST_F(References, StoredLocalIsReloaded) {
  auto helper = function("helper", "LOAD_CONST None\nRETURN_VALUE");
  globals->emplace("helper", helper);
  auto x = function("x", R"(
    2 LOAD_GLOBAL helper
      STORE_FAST h
    3 LOAD_FAST h
      CALL_FUNCTION 0
      POP_TOP
    4 LOAD_FAST h
      CALL_FUNCTION 0
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(x), (reference_list{rt::value(helper), rt::value(helper)}));
}

TEST_F(References, DeletedLocalIsForgotten) {
  globals->emplace("a", 1);
  auto x = function("x", R"(
    2 LOAD_GLOBAL a
      STORE_FAST t
    3 LOAD_FAST t
      DELETE_FAST t
    4 LOAD_FAST t
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(x), reference_list{});
  EXPECT_TRUE(sink.empty());

  auto y = function("y", R"(
    2 LOAD_GLOBAL a
      DELETE_FAST never_stored
    3 LOAD_GLOBAL a
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(y), reference_list{rt::value(1)});
  ASSERT_EQ(sink.diagnostics().size(), 1);
  EXPECT_THAT(sink.diagnostics()[0].what, HasSubstr("never_stored"));
}

TEST_F(References, OrderIsKeptAndNothingIsDeduplicated) {
  globals->emplace("a", 1);
  globals->emplace("b", 2);
  auto x = function("x", R"(
    2 LOAD_GLOBAL b
      LOAD_GLOBAL a
      BINARY_ADD
      LOAD_GLOBAL b
      BINARY_ADD
      LOAD_GLOBAL undefined
      BINARY_ADD
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(x),
            (reference_list{rt::value(2), rt::value(1), rt::value(2), partial_name{"undefined"}}));
}

TEST_F(References, Idempotent) {
  auto my_class = klass("MyClass");
  globals->emplace("MyClass", my_class);
  auto x = function("x", R"(
    2 LOAD_GLOBAL MyClass
      STORE_FAST c
    3 LOAD_FAST c
      LOAD_ATTR missing
      LOAD_FAST c
      RETURN_VALUE
  )");
  auto ctx = build_context(x);
  diag::collecting_sink first_sink, second_sink;
  auto first = extract_references(*x->code, ctx, modules, first_sink);
  auto second = extract_references(*x->code, ctx, modules, second_sink);
  EXPECT_EQ(first, second);
  EXPECT_EQ(first, reference_list{rt::value(my_class)});
  EXPECT_TRUE(ctx.locals.empty());
  EXPECT_EQ(first_sink.diagnostics().size(), second_sink.diagnostics().size());
}

TEST_F(References, FailingLookupDropsOnlyThatReference) {
  auto m = modules.add("m");
  globals->emplace("m", m);
  globals->emplace("a", 42);
  globals->emplace("b", 7);
  auto x = function("x", R"(
    2 LOAD_GLOBAL a
      POP_TOP
    3 LOAD_GLOBAL m
      LOAD_ATTR missing
      CALL_FUNCTION 0
      POP_TOP
    4 LOAD_GLOBAL b
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(x), (reference_list{rt::value(42), rt::value(7)}));
  ASSERT_EQ(sink.diagnostics().size(), 1);
  const diag::diagnostic &d = sink.diagnostics()[0];
  EXPECT_EQ(d.callable, "x");
  EXPECT_EQ(d.filename, "test_code_references.casm");
  EXPECT_EQ(d.line, 3);
  EXPECT_THAT(d.what, HasSubstr("has no attribute 'missing'"));
}

TEST_F(References, MalformedInstructionsAreReported) {
  globals->emplace("b", 7);
  auto x = function("x", R"(
    2 LOAD_GLOBAL 42
    5 LOAD_DEREF not_captured
      LOAD_ATTR "quoted"
      LOAD_GLOBAL b
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(x), reference_list{rt::value(7)});
  ASSERT_EQ(sink.diagnostics().size(), 3);
  EXPECT_EQ(sink.diagnostics()[0].line, 2);
  EXPECT_THAT(sink.diagnostics()[0].what, HasSubstr("LOAD_GLOBAL expects a name"));
  EXPECT_EQ(sink.diagnostics()[1].line, 5);
  EXPECT_THAT(sink.diagnostics()[1].what, HasSubstr("not_captured"));
  EXPECT_EQ(sink.diagnostics()[2].line, 5);
}

TEST_F(References, GlobalsAreReadWhenWalking) {
  auto x = function("x", R"(
    2 LOAD_GLOBAL late
      RETURN_VALUE
  )");
  EXPECT_EQ(get_references(x), reference_list{partial_name{"late"}});
  globals->emplace("late", "defined");
  EXPECT_EQ(get_references(x), reference_list{rt::value("defined")});
}

TEST_F(References, ContractViolationIsNotAnEmptyList) {
  auto x = function("x", R"(
    2 LOAD_DEREF a
      LOAD_DEREF b
      BINARY_ADD
      RETURN_VALUE
  )", {}, {"a", "b"}, {cell(1)});
  EXPECT_THROW(get_references(x), error::contract_violation);
  EXPECT_THROW(get_references(rt::value(42)), error::contract_violation);
  EXPECT_TRUE(sink.empty());
}

}
}
