// Error codes, factories and Result<T> behaviour

#include <QtTest>

#include <montage/common/errors.h>

#include <memory>
#include <stdexcept>

using namespace montage;

class TestErrors : public QObject
{
    Q_OBJECT

private slots:
    void test_error_code_to_string_all_codes() {
        QCOMPARE(QString(error_code_to_string(ErrorCode::Ok)), QString("Ok"));
        QCOMPARE(QString(error_code_to_string(ErrorCode::InvalidArg)), QString("InvalidArg"));
        QCOMPARE(QString(error_code_to_string(ErrorCode::OutOfRange)), QString("OutOfRange"));
        QCOMPARE(QString(error_code_to_string(ErrorCode::InvalidSplitPoint)), QString("InvalidSplitPoint"));
        QCOMPARE(QString(error_code_to_string(ErrorCode::EmptyInterval)), QString("EmptyInterval"));
        QCOMPARE(QString(error_code_to_string(ErrorCode::NotReady)), QString("NotReady"));
        QCOMPARE(QString(error_code_to_string(ErrorCode::SourceMissing)), QString("SourceMissing"));
        QCOMPARE(QString(error_code_to_string(ErrorCode::DecodeFailed)), QString("DecodeFailed"));
        QCOMPARE(QString(error_code_to_string(ErrorCode::Unsupported)), QString("Unsupported"));
        QCOMPARE(QString(error_code_to_string(ErrorCode::Duplicate)), QString("Duplicate"));
        QCOMPARE(QString(error_code_to_string(ErrorCode::Internal)), QString("Internal"));
    }

    void test_error_factories() {
        QCOMPARE(Error::ok().code, ErrorCode::Ok);
        QVERIFY(Error::ok().message.empty());

        Error arg = Error::invalid_arg("bad speed");
        QCOMPARE(arg.code, ErrorCode::InvalidArg);
        QCOMPARE(arg.message, std::string("bad speed"));

        Error split = Error::invalid_split_point(4000.0);
        QCOMPARE(split.code, ErrorCode::InvalidSplitPoint);
        QVERIFY(split.message.find("4000") != std::string::npos);

        Error empty = Error::empty_interval(1.0, 1.01);
        QCOMPARE(empty.code, ErrorCode::EmptyInterval);
        QVERIFY(empty.message.find("1.0") != std::string::npos);

        QCOMPARE(Error::not_ready("x").code, ErrorCode::NotReady);
        QCOMPARE(Error::source_missing("x").code, ErrorCode::SourceMissing);
        QCOMPARE(Error::decode_failed("x").code, ErrorCode::DecodeFailed);
        QCOMPARE(Error::unsupported("x").code, ErrorCode::Unsupported);
        QCOMPARE(Error::duplicate("x").code, ErrorCode::Duplicate);
        QCOMPARE(Error::internal("x").code, ErrorCode::Internal);
    }

    void test_result_value() {
        Result<int> result(42);
        QVERIFY(result.is_ok());
        QVERIFY(!result.is_error());
        QCOMPARE(result.value(), 42);
        QCOMPARE(result.unwrap(), 42);
    }

    void test_result_error() {
        Result<int> result(Error::out_of_range("index 7"));
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, ErrorCode::OutOfRange);
        QVERIFY_THROWS_EXCEPTION(std::runtime_error, result.unwrap());
    }

    void test_result_move_only_value() {
        Result<std::unique_ptr<int>> result(std::make_unique<int>(5));
        QVERIFY(result.is_ok());
        std::unique_ptr<int> owned = result.unwrap();
        QVERIFY(owned);
        QCOMPARE(*owned, 5);
    }

    void test_result_void() {
        Result<void> ok;
        QVERIFY(ok.is_ok());
        ok.unwrap();

        Result<void> failed(Error::not_ready("loading"));
        QVERIFY(failed.is_error());
        QCOMPARE(failed.error().code, ErrorCode::NotReady);
        QVERIFY_THROWS_EXCEPTION(std::runtime_error, failed.unwrap());
    }
};

QTEST_MAIN(TestErrors)
#include "test_errors.moc"
