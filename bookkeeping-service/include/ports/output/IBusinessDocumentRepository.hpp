#pragma once

#include "domain/BusinessDocument.hpp"
#include <optional>
#include <vector>

namespace bookkeeping::ports::output {

/**
 * @brief Репозиторий хозяйственных документов
 */
class IBusinessDocumentRepository {
public:
    virtual ~IBusinessDocumentRepository() = default;

    /**
     * @brief Вставить документ со строками
     * @return Документ с присвоенными id (документа и строк)
     */
    virtual domain::BusinessDocument save(const domain::BusinessDocument& document) = 0;

    virtual std::optional<domain::BusinessDocument> findById(int64_t id) = 0;

    /**
     * @brief Документы по убыванию даты
     */
    virtual std::vector<domain::BusinessDocument> findAll(
        const std::optional<domain::BusinessDocumentType>& type,
        std::size_t limit
    ) = 0;

    /**
     * @brief Количество документов данного типа за дату
     */
    virtual std::size_t countByTypeAndDate(domain::BusinessDocumentType type,
                                           const domain::Date& date) = 0;

    /**
     * @brief Сериализовать нумерацию документов (type, date) до конца Unit of Work
     *
     * Без этого два параллельных документа одного типа за один день могут
     * получить одинаковый номер (count-then-format).
     */
    virtual void lockNumbering(domain::BusinessDocumentType type, const domain::Date& date) = 0;
};

} // namespace bookkeeping::ports::output
