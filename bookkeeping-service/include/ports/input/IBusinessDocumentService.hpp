#pragma once

#include "domain/BusinessDocument.hpp"
#include <optional>
#include <vector>

namespace bookkeeping::ports::input {

/**
 * @brief Интерфейс проведения хозяйственных документов
 */
class IBusinessDocumentService {
public:
    virtual ~IBusinessDocumentService() = default;

    /**
     * @brief Провести документ: N строк -> одна транзакция из 2N проводок
     * @throws ValidationError
     */
    virtual domain::BusinessDocument postBusinessDocument(
        const domain::BusinessDocumentRequest& request,
        domain::BusinessDocumentType type) = 0;

    /**
     * @throws NotFoundError
     */
    virtual domain::BusinessDocument getBusinessDocument(int64_t id) = 0;

    virtual std::vector<domain::BusinessDocument> listBusinessDocuments(
        const std::optional<domain::BusinessDocumentType>& type = std::nullopt,
        std::size_t limit = 50) = 0;
};

} // namespace bookkeeping::ports::input
