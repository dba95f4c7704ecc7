#include <gtest/gtest.h>
#include <DomainException.hpp>

// Сообщение передаётся вызывающему без изменений
TEST(DomainExceptionTest, ValidationErrorKeepsMessage) {
    try {
        throw ValidationError("Transaction is not balanced: sum of splits must be 0");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Transaction is not balanced: sum of splits must be 0");
    }
}

TEST(DomainExceptionTest, NotFoundErrorKeepsMessage) {
    try {
        throw NotFoundError("Account abc does not exist");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Account abc does not exist");
    }
}

// Вызывающий различает два вида ошибок по типу
TEST(DomainExceptionTest, KindsAreDistinct) {
    EXPECT_THROW(throw NotFoundError("missing"), NotFoundError);
    EXPECT_THROW(throw ValidationError("bad"), ValidationError);

    bool caughtAsValidation = false;
    try {
        throw NotFoundError("missing");
    } catch (const ValidationError&) {
        caughtAsValidation = true;
    } catch (const NotFoundError&) {
    }
    EXPECT_FALSE(caughtAsValidation);
}
