#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include <iostream>
#include <string>
#include <type_traits>

namespace bookkeeping::application {

/**
 * @brief Выполнить действие в новом Unit of Work
 *
 * commit() при успехе; rollback(), запись в лог и проброс исключения при ошибке.
 * Возвращает результат действия.
 *
 * @param component Тег компонента для лога ("LedgerService")
 */
template <typename Action>
auto runInUnitOfWork(ports::output::IUnitOfWorkFactory& factory,
                     const std::string& component,
                     Action&& action)
{
    auto uow = factory.begin();
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Action&, ports::output::IUnitOfWork&>>) {
            action(*uow);
            uow->commit();
        } else {
            auto result = action(*uow);
            uow->commit();
            return result;
        }
    } catch (const std::exception& e) {
        uow->rollback();
        std::cerr << "[" << component << "] Rolled back: " << e.what() << std::endl;
        throw;
    }
}

} // namespace bookkeeping::application
