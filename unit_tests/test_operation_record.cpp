#include "gtest/gtest.h"
#include "core/operation_record.h"
#include "core/error_kind.h"

TEST(OperationRecordTest, KindNamesAreStable) {
    EXPECT_EQ(operationKindToString(OperationKind::BACKUP), "BACKUP");
    EXPECT_EQ(operationKindToString(OperationKind::DELETE), "DELETE");
    EXPECT_EQ(operationKindToString(OperationKind::RESTORE), "RESTORE");
}

TEST(OperationRecordTest, KindFromStringIgnoresCase) {
    EXPECT_EQ(operationKindFromString("backup"), OperationKind::BACKUP);
    EXPECT_EQ(operationKindFromString("Delete"), OperationKind::DELETE);
    EXPECT_EQ(operationKindFromString("RESTORE"), OperationKind::RESTORE);
    EXPECT_FALSE(operationKindFromString("copy").has_value());
    EXPECT_FALSE(operationKindFromString("").has_value());
}

TEST(OperationRecordTest, OutcomeNames) {
    EXPECT_EQ(operationOutcomeToString(OperationOutcome::SUCCESS), "SUCCESS");
    EXPECT_EQ(operationOutcomeToString(OperationOutcome::FAILURE), "FAILURE");
    EXPECT_EQ(operationOutcomeToString(OperationOutcome::CANCELLED), "CANCELLED");
}

TEST(OperationRecordTest, DefaultRecordIsFailureWithoutError) {
    OperationRecord record;
    EXPECT_EQ(record.outcome, OperationOutcome::FAILURE);
    EXPECT_EQ(record.error, ErrorKind::NONE);
    EXPECT_TRUE(record.filename.empty());
}

TEST(ErrorKindTest, EveryKindHasNameAndDescription) {
    for (ErrorKind kind : {ErrorKind::EMPTY_NAME, ErrorKind::NAME_TOO_LONG, ErrorKind::INVALID_CHARACTER,
                           ErrorKind::PATH_TRAVERSAL, ErrorKind::ABSOLUTE_PATH, ErrorKind::FILE_NOT_FOUND,
                           ErrorKind::ALREADY_EXISTS, ErrorKind::NOT_REGULAR_FILE, ErrorKind::IO_FAILURE}) {
        EXPECT_NE(errorKindToString(kind), "UNKNOWN");
        EXPECT_FALSE(errorKindDescription(kind).empty());
    }
    EXPECT_EQ(errorKindToString(ErrorKind::PATH_TRAVERSAL), "PATH_TRAVERSAL");
    EXPECT_EQ(errorKindToString(ErrorKind::IO_FAILURE), "IO_FAILURE");
}
