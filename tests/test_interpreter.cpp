#include <QtTest/QtTest>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "script/default_scope.hpp"
#include "script/errors.hpp"
#include "script/parser.hpp"
#include "script/value.hpp"

using cascade::script::DefaultScope;
using cascade::script::FileSet;
using cascade::script::ScriptError;
using cascade::script::Value;

namespace {

Value evalSource(const std::string &source)
{
    auto files = std::make_shared<FileSet>();
    const auto root = cascade::script::parse(*files, "test.rule", source);
    auto scope = std::make_shared<DefaultScope>(files);
    return scope->eval(root);
}

// Returns the error message, or an empty string when evaluation succeeded.
QString evalError(const std::string &source)
{
    try {
        evalSource(source);
    } catch (const ScriptError &error) {
        return QString::fromStdString(error.what());
    }
    return QString();
}

} // namespace

class InterpreterTests : public QObject
{
    Q_OBJECT
private slots:
    void testArithmetic();
    void testIntegerOverflow();
    void testStringConcat();
    void testComparisons();
    void testLogic();
    void testVarAndSet();
    void testDoScoping();
    void testFunctions();
    void testRecursion();
    void testForLoop();
    void testListBuiltins();
    void testValueEquality();
    void testValueJson();
    void testErrorsCarryPosition();
    void testErrorBuiltin();
    void testCallErrors();
};

void InterpreterTests::testArithmetic()
{
    QCOMPARE(evalSource("(+ 1 2 3)"), Value(6));
    QVERIFY(evalSource("(+ 1 2)").isInt());
    QCOMPARE(evalSource("(+ 1 2.5)"), Value(3.5));
    QCOMPARE(evalSource("(- 10 4 1)"), Value(5));
    QCOMPARE(evalSource("(- 3)"), Value(-3));
    QCOMPARE(evalSource("(* 2 3 4)"), Value(24));
    QCOMPARE(evalSource("(/ 7 2)"), Value(3));
    QCOMPARE(evalSource("(/ 7.0 2)"), Value(3.5));
    QCOMPARE(evalSource("(% 7 3)"), Value(1));
    QVERIFY(evalError("(/ 1 0)").contains(QStringLiteral("division by zero")));
    QVERIFY(evalError("(% 1 0)").contains(QStringLiteral("division by zero")));
    QVERIFY(evalError("(* 2 \"x\")").contains(QStringLiteral("takes numbers")));
}

void InterpreterTests::testIntegerOverflow()
{
    QCOMPARE(evalSource("(- 0 9223372036854775807 1)"),
             Value(std::numeric_limits<std::int64_t>::min()));
    QVERIFY(evalError("(+ 9223372036854775807 1)").contains(QStringLiteral("integer overflow")));
    QVERIFY(evalError("(- (- 0 9223372036854775807 1))").contains(QStringLiteral("integer overflow")));
    QVERIFY(evalError("(- (- 0 9223372036854775807) 2)").contains(QStringLiteral("integer overflow")));
    QVERIFY(evalError("(* 9223372036854775807 2)").contains(QStringLiteral("integer overflow")));
    QVERIFY(evalError("(/ (- 0 9223372036854775807 1) -1)").contains(QStringLiteral("integer overflow")));
    QVERIFY(evalError("(% (- 0 9223372036854775807 1) -1)").contains(QStringLiteral("integer overflow")));

    // Float arithmetic is unchecked.
    QCOMPARE(evalSource("(* 9223372036854775807 2.0)"), Value(1.8446744073709552e19));
}

void InterpreterTests::testStringConcat()
{
    QCOMPARE(evalSource("(+ \"light:\" \"on\")"), Value("light:on"));
    QVERIFY(evalError("(+ \"a\" 1)").contains(QStringLiteral("cannot mix")));
    QCOMPARE(evalSource("(str 1.5)"), Value("1.5"));
    QCOMPARE(evalSource("(str (list 1 \"a\"))"), Value("(1 \"a\")"));
}

void InterpreterTests::testComparisons()
{
    QCOMPARE(evalSource("(== 1 1)"), Value(true));
    QCOMPARE(evalSource("(== 1 1.0)"), Value(false));
    QCOMPARE(evalSource("(!= \"a\" \"b\")"), Value(true));
    QCOMPARE(evalSource("(< 1 2.5)"), Value(true));
    QCOMPARE(evalSource("(>= 3 3)"), Value(true));
    QCOMPARE(evalSource("(> \"b\" \"a\")"), Value(true));
    QCOMPARE(evalSource("(== (list 1 (list 2)) (list 1 (list 2)))"), Value(true));
    QVERIFY(evalError("(< 1 \"a\")").contains(QStringLiteral("cannot compare")));
}

void InterpreterTests::testLogic()
{
    QCOMPARE(evalSource("(and 1 2)"), Value(2));
    QCOMPARE(evalSource("(and 1 nil 2)"), Value());
    QCOMPARE(evalSource("(or false 0)"), Value(0));
    QCOMPARE(evalSource("(not nil)"), Value(true));
    QCOMPARE(evalSource("(if (> 2 1) \"yes\" \"no\")"), Value("yes"));
    QCOMPARE(evalSource("(if false \"yes\")"), Value());

    // Short-circuit: the undefined symbol is never looked up.
    QCOMPARE(evalSource("(or true missing)"), Value(true));
    QCOMPARE(evalSource("(and false missing)"), Value(false));
}

void InterpreterTests::testVarAndSet()
{
    QCOMPARE(evalSource("(var x 1) (set x (+ x 1)) x"), Value(2));
    QCOMPARE(evalSource("(var x)"), Value());
    QCOMPARE(evalSource("(var x 1) (set x 5)"), Value());
    QVERIFY(evalError("(var x 1) (var x 2)").contains(QStringLiteral("already defined")));
    QVERIFY(evalError("(set y 1)").contains(QStringLiteral("undefined symbol: y")));
    QVERIFY(evalError("(var 1 2)").contains(QStringLiteral("symbol name")));
}

void InterpreterTests::testDoScoping()
{
    QCOMPARE(evalSource("(var x 1) (do (var x 2) (set x 3)) x"), Value(1));
    QCOMPARE(evalSource("(var x 1) (do (set x 3)) x"), Value(3));
    QCOMPARE(evalSource("(do 1 2 3)"), Value(3));
    QVERIFY(evalError("(do (var inner 1)) inner").contains(QStringLiteral("undefined symbol")));
}

void InterpreterTests::testFunctions()
{
    QCOMPARE(evalSource("(func add (a b) (+ a b)) (add 2 3)"), Value(5));
    QCOMPARE(evalSource("(var twice (func (x) (* x 2))) (twice 21)"), Value(42));
    QCOMPARE(evalSource("(var n 10) (func addn (x) (+ x n)) (set n 20) (addn 1)"), Value(21));
    QVERIFY(evalError("(func f (a) a) (f 1 2)").contains(QStringLiteral("takes 1 arguments, got 2")));
    QVERIFY(evalSource("(func f () 1)").isFunction());
}

void InterpreterTests::testRecursion()
{
    const std::string source =
        "(func fib (n)\n"
        "  (if (< n 2) n (+ (fib (- n 1)) (fib (- n 2)))))\n"
        "(fib 10)";
    QCOMPARE(evalSource(source), Value(55));
}

void InterpreterTests::testForLoop()
{
    const std::string source =
        "(var total 0)\n"
        "(for (var i 0) (< i 5) (set i (+ i 1))\n"
        "  (set total (+ total i)))\n"
        "total";
    QCOMPARE(evalSource(source), Value(10));
    QCOMPARE(evalSource("(for (var i 0) false (set i 1))"), Value());
    QVERIFY(evalError("(for (var i 0) false (set i 1)) i").contains(QStringLiteral("undefined symbol: i")));
}

void InterpreterTests::testListBuiltins()
{
    QCOMPARE(evalSource("(len (list 1 2 3))"), Value(3));
    QCOMPARE(evalSource("(len \"abcd\")"), Value(4));
    QCOMPARE(evalSource("(nth (list \"a\" \"b\") 1)"), Value("b"));
    QVERIFY(evalError("(nth (list 1) 3)").contains(QStringLiteral("out of range")));
    QVERIFY(evalError("(len 5)").contains(QStringLiteral("list or a string")));
}

void InterpreterTests::testValueEquality()
{
    QVERIFY(Value(1) == Value(static_cast<std::int64_t>(1)));
    QVERIFY(Value(1) != Value(1.0));
    QVERIFY(Value() == Value(nullptr));
    QVERIFY(Value(false) != Value());
    QVERIFY(Value(Value::List{Value(1), Value("a")}) == Value(Value::List{Value(1), Value("a")}));
    QVERIFY(Value(Value::List{Value(1)}) != Value(Value::List{Value(1), Value(2)}));

    const Value fn = evalSource("(func f () 1)");
    QVERIFY(fn == fn);
    QVERIFY(!fn.isPersistable());
    QVERIFY(!Value(Value::List{fn}).isPersistable());
    QVERIFY(Value(Value::List{Value("x")}).isPersistable());
}

void InterpreterTests::testValueJson()
{
    const Value nested(Value::List{Value(1), Value(2.5), Value("s"), Value(true), Value()});
    const nlohmann::json encoded = nested;
    QCOMPARE(QString::fromStdString(encoded.dump()), QStringLiteral("[1,2.5,\"s\",true,null]"));
    QVERIFY(encoded.get<Value>() == nested);

    QVERIFY(nlohmann::json::parse("3").get<Value>().isInt());
    QVERIFY(nlohmann::json::parse("3.0").get<Value>().isFloat());

    bool threw = false;
    try {
        nlohmann::json rejected = evalSource("(func f () 1)");
        Q_UNUSED(rejected);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    QVERIFY(threw);

    threw = false;
    try {
        nlohmann::json::parse("{\"a\":1}").get<Value>();
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    QVERIFY(threw);
}

void InterpreterTests::testErrorsCarryPosition()
{
    try {
        evalSource("(var x 1)\n(+ x missing)");
        QFAIL("expected an evaluation error");
    } catch (const ScriptError &error) {
        QVERIFY(error.hasPosition());
        QCOMPARE(QString::fromStdString(error.position()), QStringLiteral("test.rule:2:6"));
        QCOMPARE(QString::fromStdString(error.message()), QStringLiteral("undefined symbol: missing"));
    }
}

void InterpreterTests::testErrorBuiltin()
{
    QVERIFY(evalError("(error \"boom\")").endsWith(QStringLiteral("boom")));
    QVERIFY(evalError("(if true (error \"inner\") 1)").contains(QStringLiteral("inner")));
}

void InterpreterTests::testCallErrors()
{
    QVERIFY(evalError("()").contains(QStringLiteral("empty list")));
    QVERIFY(evalError("(1 2)").contains(QStringLiteral("cannot call value of type int")));
    QVERIFY(evalError("(\"x\")").contains(QStringLiteral("type string")));
    QVERIFY(evalError("(if 1)").contains(QStringLiteral("two or three")));
}

QTEST_MAIN(InterpreterTests)
#include "test_interpreter.moc"
