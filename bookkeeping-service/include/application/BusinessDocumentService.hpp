#pragma once

#include "ports/input/IBusinessDocumentService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "application/LedgerPosting.hpp"
#include "application/UnitOfWorkRunner.hpp"
#include <DomainException.hpp>
#include <cstdio>
#include <iostream>
#include <map>
#include <memory>
#include <set>

namespace bookkeeping::application {

/**
 * @brief Проведение хозяйственных документов
 *
 * Документ из N строк превращается в одну транзакцию из 2N проводок:
 * дебет (+amount) и кредит (-amount) на каждую строку. Документ, транзакция
 * и изменения сальдо фиксируются одним Unit of Work.
 */
class BusinessDocumentService : public ports::input::IBusinessDocumentService {
public:
    explicit BusinessDocumentService(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory)
        : uowFactory_(std::move(uowFactory))
    {
        std::cout << "[BusinessDocumentService] Created" << std::endl;
    }

    domain::BusinessDocument postBusinessDocument(const domain::BusinessDocumentRequest& request,
                                                  domain::BusinessDocumentType type) override
    {
        auto document = runInUnitOfWork(*uowFactory_, "BusinessDocumentService", [&](auto& uow) {
            return compose(uow, request, type);
        });

        std::cout << "[BusinessDocumentService] Posted " << domain::toString(type) << " document "
                  << document.docNo << " -> transaction " << document.transactionId << std::endl;
        return document;
    }

    domain::BusinessDocument getBusinessDocument(int64_t id) override {
        auto uow = uowFactory_->begin();
        auto document = uow->documents().findById(id);
        if (!document) {
            throw NotFoundError("Business document not found: " + std::to_string(id));
        }
        return *document;
    }

    std::vector<domain::BusinessDocument> listBusinessDocuments(
        const std::optional<domain::BusinessDocumentType>& type,
        std::size_t limit) override
    {
        auto uow = uowFactory_->begin();
        return uow->documents().findAll(type, limit);
    }

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;

    static domain::BusinessDocument compose(ports::output::IUnitOfWork& uow,
                                            const domain::BusinessDocumentRequest& request,
                                            domain::BusinessDocumentType type)
    {
        for (const auto& item : request.items) {
            if (item.amount.signum() <= 0) {
                throw ValidationError("Item amount must be positive, got " + item.amount.toString());
            }
        }

        auto accounts = loadAccounts(uow, request);
        requireCashflowTypes(uow, request);

        std::string docNo;
        if (request.docNo && !isBlank(*request.docNo)) {
            docNo = *request.docNo;
        } else {
            docNo = generateDocNo(uow, type, request.docDate);
        }

        const std::string typeName = domain::toString(type);

        domain::TransactionRequest transactionRequest;
        transactionRequest.num = docNo;
        transactionRequest.postDate = request.docDate;
        transactionRequest.description = request.description ? *request.description : typeName + " document";
        transactionRequest.businessType = typeName;
        transactionRequest.referenceNo = request.referenceNo;

        for (const auto& item : request.items) {
            std::string memo = item.memo ? *item.memo
                             : request.description ? *request.description
                             : typeName + " detail";
            auto cashflowTypeId = item.cashflowTypeId ? item.cashflowTypeId : request.cashflowTypeId;

            transactionRequest.splits.push_back(domain::SplitRequest{
                item.debitAccountId, item.amount, memo,
                resolveCashflowType(accounts.at(item.debitAccountId), cashflowTypeId)});
            transactionRequest.splits.push_back(domain::SplitRequest{
                item.creditAccountId, -item.amount, memo,
                resolveCashflowType(accounts.at(item.creditAccountId), cashflowTypeId)});
        }

        auto transaction = LedgerPosting(uow).post(transactionRequest);

        auto now = domain::Timestamp::now();
        domain::BusinessDocument document;
        document.docType = type;
        document.docNo = docNo;
        document.docDate = request.docDate;
        document.partnerName = request.partnerName;
        document.referenceNo = request.referenceNo;
        document.description = request.description;
        document.currency = request.currency.empty() ? "CNY" : request.currency;
        document.status = "POSTED";
        document.transactionId = transaction.id;
        document.createdAt = now;
        document.updatedAt = now;

        int position = 1;
        for (const auto& input : request.items) {
            domain::BusinessDocumentItem item;
            item.lineNo = input.lineNo ? *input.lineNo : position;
            item.description = input.description;
            item.memo = input.memo;
            item.debitAccountId = input.debitAccountId;
            item.creditAccountId = input.creditAccountId;
            item.quantity = input.quantity;
            item.unitPrice = input.unitPrice;
            item.amount = input.amount;
            item.cashflowTypeId = input.cashflowTypeId ? input.cashflowTypeId : request.cashflowTypeId;
            item.createdAt = now;
            document.totalAmount += input.amount;
            document.items.push_back(std::move(item));
            ++position;
        }

        return uow.documents().save(document);
    }

    /**
     * @brief Загрузить все счета строк одним запросом
     * @throws ValidationError нет строк либо есть несуществующие счета (список отсортирован)
     */
    static std::map<std::string, domain::Account> loadAccounts(ports::output::IUnitOfWork& uow,
                                                               const domain::BusinessDocumentRequest& request)
    {
        std::set<std::string> ids;
        for (const auto& item : request.items) {
            ids.insert(item.debitAccountId);
            ids.insert(item.creditAccountId);
        }
        if (ids.empty()) {
            throw ValidationError("No accounts to match: document has no items");
        }

        std::map<std::string, domain::Account> accounts;
        for (auto& account : uow.accounts().findByIds(ids)) {
            accounts.emplace(account.id, std::move(account));
        }

        std::string missing;
        for (const auto& id : ids) {
            if (!accounts.count(id)) {
                missing += (missing.empty() ? "" : ", ") + id;
            }
        }
        if (!missing.empty()) {
            throw ValidationError("The following accounts do not exist: " + missing);
        }
        return accounts;
    }

    static void requireCashflowTypes(ports::output::IUnitOfWork& uow,
                                     const domain::BusinessDocumentRequest& request)
    {
        std::set<int64_t> ids;
        if (request.cashflowTypeId) {
            ids.insert(*request.cashflowTypeId);
        }
        for (const auto& item : request.items) {
            if (item.cashflowTypeId) {
                ids.insert(*item.cashflowTypeId);
            }
        }
        if (ids.empty()) {
            return;
        }

        std::set<int64_t> found;
        for (const auto& type : uow.cashflowTypes().findByIds(ids)) {
            found.insert(type.id);
        }

        std::string missing;
        for (auto id : ids) {
            if (!found.count(id)) {
                missing += (missing.empty() ? "" : ", ") + std::to_string(id);
            }
        }
        if (!missing.empty()) {
            throw ValidationError("The following cashflow types do not exist: " + missing);
        }
    }

    /**
     * @brief Денежному счёту статья ДДС обязательна
     */
    static std::optional<int64_t> resolveCashflowType(const domain::Account& account,
                                                      const std::optional<int64_t>& candidate)
    {
        if (account.isCash && !candidate) {
            throw ValidationError("Cash account " + account.name + " requires a cashflow type");
        }
        // Статья нужна только денежной стороне: иначе приход и расход по статье взаимно гасятся
        return account.isCash ? candidate : std::nullopt;
    }

    /**
     * @brief {prefix}-{YYYYMMDD}-{NNN}, NNN = число документов того же типа за дату + 1
     */
    static std::string generateDocNo(ports::output::IUnitOfWork& uow,
                                     domain::BusinessDocumentType type,
                                     const domain::Date& date)
    {
        uow.documents().lockNumbering(type, date);
        std::size_t seq = uow.documents().countByTypeAndDate(type, date) + 1;

        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), "%03zu", seq);
        return domain::getNumberPrefix(type) + "-" + date.toCompactString() + "-" + suffix;
    }

    static bool isBlank(const std::string& text) {
        return text.find_first_not_of(" \t\r\n") == std::string::npos;
    }
};

} // namespace bookkeeping::application
