/**
 * @file BusinessDocumentServiceTest.cpp
 * @brief Unit tests for BusinessDocumentService
 */

#include "LedgerTestBase.hpp"
#include "application/BusinessDocumentService.hpp"
#include "application/FinancialReportService.hpp"

using namespace bookkeeping;
using namespace bookkeeping::tests;

class BusinessDocumentServiceTest : public LedgerTestBase {
protected:
    void SetUp() override {
        LedgerTestBase::SetUp();
        documentService_ = std::make_shared<application::BusinessDocumentService>(uowFactory_);

        cash_ = createAccount("Cash", "CASH", true);
        receivable_ = createAccount("Receivables", "RECEIVABLE");
        sales_ = createAccount("Sales", "INCOME");
        salesReceipts_ = createCashflowType("OP-IN-01", domain::FlowType::OPERATING,
                                            domain::CashflowDirection::INFLOW);
    }

    static domain::BusinessDocumentItemRequest item(const std::string& debit,
                                                    const std::string& credit,
                                                    const char* amount)
    {
        domain::BusinessDocumentItemRequest request;
        request.debitAccountId = debit;
        request.creditAccountId = credit;
        request.amount = d(amount);
        return request;
    }

    domain::BusinessDocumentRequest saleOnCredit(const char* amount) {
        domain::BusinessDocumentRequest request;
        request.docDate = docDate_;
        request.partnerName = "ACME";
        request.items = {item(receivable_, sales_, amount)};
        return request;
    }

    std::shared_ptr<application::BusinessDocumentService> documentService_;
    std::string cash_;
    std::string receivable_;
    std::string sales_;
    int64_t salesReceipts_ = 0;
    const domain::Date docDate_{2025, 11, 20};
};

// ============================================================================
// POSTING
// ============================================================================

TEST_F(BusinessDocumentServiceTest, Post_CreatesTwoSplitsPerItem) {
    auto request = saleOnCredit("100");
    request.items.push_back(item(receivable_, sales_, "50.50"));

    auto document = documentService_->postBusinessDocument(request, domain::BusinessDocumentType::SALE);

    EXPECT_GT(document.id, 0);
    EXPECT_EQ(document.totalAmount, d("150.50"));
    EXPECT_EQ(document.status, "POSTED");
    ASSERT_EQ(document.items.size(), 2u);
    EXPECT_EQ(document.items[1].lineNo, 2);

    auto transaction = storedTransaction(document.transactionId);
    EXPECT_EQ(transaction.splits.size(), 4u);
    EXPECT_EQ(transaction.businessType, "SALE");
    EXPECT_EQ(transaction.num, document.docNo);
    EXPECT_EQ(transaction.description, "SALE document");
    EXPECT_EQ(transaction.splits[0].memo, "SALE detail");

    EXPECT_EQ(balanceOf(receivable_), d("150.50"));
    EXPECT_EQ(balanceOf(sales_), d("-150.50"));
    expectBalancesMatchSplits();
}

TEST_F(BusinessDocumentServiceTest, Post_MemoFallsBackToDescription) {
    auto request = saleOnCredit("10");
    request.description = "November invoice";

    auto document = documentService_->postBusinessDocument(request, domain::BusinessDocumentType::SALE);
    auto transaction = storedTransaction(document.transactionId);

    EXPECT_EQ(transaction.description, "November invoice");
    EXPECT_EQ(transaction.splits[0].memo, "November invoice");
}

TEST_F(BusinessDocumentServiceTest, Post_NonPositiveAmount_Rejected) {
    EXPECT_THROW(documentService_->postBusinessDocument(saleOnCredit("0"), domain::BusinessDocumentType::SALE),
                 ValidationError);
    EXPECT_THROW(documentService_->postBusinessDocument(saleOnCredit("-5"), domain::BusinessDocumentType::SALE),
                 ValidationError);
    EXPECT_EQ(store_->transactionCount(), 0u);
}

TEST_F(BusinessDocumentServiceTest, Post_NoItems_Rejected) {
    domain::BusinessDocumentRequest request;
    request.docDate = docDate_;
    EXPECT_THROW(documentService_->postBusinessDocument(request, domain::BusinessDocumentType::SALE),
                 ValidationError);
}

TEST_F(BusinessDocumentServiceTest, Post_UnknownAccounts_ListedSorted) {
    domain::BusinessDocumentRequest request;
    request.docDate = docDate_;
    request.items = {item("zzz", "aaa", "10")};

    try {
        documentService_->postBusinessDocument(request, domain::BusinessDocumentType::PURCHASE);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("aaa, zzz"), std::string::npos);
    }
}

// ============================================================================
// CASH ACCOUNTS
// ============================================================================

TEST_F(BusinessDocumentServiceTest, CashAccountWithoutCashflowType_Rejected) {
    domain::BusinessDocumentRequest request;
    request.docDate = docDate_;
    request.items = {item(cash_, sales_, "20")};

    try {
        documentService_->postBusinessDocument(request, domain::BusinessDocumentType::SALE);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("Cash account Cash requires a cashflow type"), std::string::npos);
    }
    EXPECT_EQ(store_->transactionCount(), 0u);
}

TEST_F(BusinessDocumentServiceTest, DocumentLevelCashflowType_AppliedToCashSplit) {
    domain::BusinessDocumentRequest request;
    request.docDate = docDate_;
    request.cashflowTypeId = salesReceipts_;
    request.items = {item(cash_, sales_, "20")};

    auto document = documentService_->postBusinessDocument(request, domain::BusinessDocumentType::CASHFLOW);
    auto transaction = storedTransaction(document.transactionId);

    ASSERT_EQ(transaction.splits.size(), 2u);
    EXPECT_EQ(transaction.splits[0].accountId, cash_);
    EXPECT_EQ(transaction.splits[0].cashflowTypeId, salesReceipts_);
    EXPECT_FALSE(transaction.splits[1].cashflowTypeId.has_value());
    EXPECT_EQ(document.items[0].cashflowTypeId, salesReceipts_);
}

TEST_F(BusinessDocumentServiceTest, CashSale_ShowsInCashflowStatement) {
    domain::BusinessDocumentRequest request;
    request.docDate = domain::Date(2025, 3, 12);
    request.cashflowTypeId = salesReceipts_;
    request.items = {item(cash_, sales_, "60"), item(cash_, sales_, "40")};
    documentService_->postBusinessDocument(request, domain::BusinessDocumentType::SALE);

    application::FinancialReportService reports(uowFactory_);
    auto statement = reports.cashflowStatement(domain::Date(2025, 3, 1), domain::Date(2025, 3, 31));

    EXPECT_EQ(statement.operating.inflow, d("100"));
    EXPECT_EQ(statement.operating.net, d("100"));
    EXPECT_EQ(statement.totalNet, d("100"));
}

TEST_F(BusinessDocumentServiceTest, UnknownCashflowType_Rejected) {
    domain::BusinessDocumentRequest request;
    request.docDate = docDate_;
    request.cashflowTypeId = 999;
    request.items = {item(cash_, sales_, "20")};

    EXPECT_THROW(documentService_->postBusinessDocument(request, domain::BusinessDocumentType::CASHFLOW),
                 ValidationError);
}

// ============================================================================
// NUMBERING
// ============================================================================

TEST_F(BusinessDocumentServiceTest, DocNo_SequentialPerTypeAndDate) {
    auto first = documentService_->postBusinessDocument(saleOnCredit("1"), domain::BusinessDocumentType::SALE);
    auto second = documentService_->postBusinessDocument(saleOnCredit("2"), domain::BusinessDocumentType::SALE);
    auto purchase = documentService_->postBusinessDocument(saleOnCredit("3"), domain::BusinessDocumentType::PURCHASE);

    EXPECT_EQ(first.docNo, "XS-20251120-001");
    EXPECT_EQ(second.docNo, "XS-20251120-002");
    EXPECT_EQ(purchase.docNo, "CG-20251120-001");
}

TEST_F(BusinessDocumentServiceTest, DocNo_ExplicitKept_BlankGenerated) {
    auto request = saleOnCredit("1");
    request.docNo = "INV-42";
    EXPECT_EQ(documentService_->postBusinessDocument(request, domain::BusinessDocumentType::SALE).docNo, "INV-42");

    request.docNo = "   ";
    EXPECT_EQ(documentService_->postBusinessDocument(request, domain::BusinessDocumentType::EXPENSE).docNo,
              "FY-20251120-001");
}

TEST_F(BusinessDocumentServiceTest, FailedDocument_DoesNotConsumeNumber) {
    domain::BusinessDocumentRequest broken;
    broken.docDate = docDate_;
    broken.items = {item(cash_, sales_, "20")};
    EXPECT_THROW(documentService_->postBusinessDocument(broken, domain::BusinessDocumentType::SALE),
                 ValidationError);

    auto document = documentService_->postBusinessDocument(saleOnCredit("5"), domain::BusinessDocumentType::SALE);
    EXPECT_EQ(document.docNo, "XS-20251120-001");
}

// ============================================================================
// QUERIES
// ============================================================================

TEST_F(BusinessDocumentServiceTest, GetAndList) {
    auto sale = documentService_->postBusinessDocument(saleOnCredit("1"), domain::BusinessDocumentType::SALE);
    documentService_->postBusinessDocument(saleOnCredit("2"), domain::BusinessDocumentType::PURCHASE);

    EXPECT_EQ(documentService_->getBusinessDocument(sale.id).docNo, sale.docNo);
    EXPECT_THROW(documentService_->getBusinessDocument(12345), NotFoundError);

    EXPECT_EQ(documentService_->listBusinessDocuments(std::nullopt, 50).size(), 2u);
    auto sales = documentService_->listBusinessDocuments(domain::BusinessDocumentType::SALE, 50);
    ASSERT_EQ(sales.size(), 1u);
    EXPECT_EQ(sales[0].id, sale.id);
}
