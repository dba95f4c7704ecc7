#include "domain/ReportJson.hpp"

namespace bookkeeping::domain {

namespace {

nlohmann::json lineToJson(const ReportLine& line) {
    nlohmann::json j;
    j["guid"] = line.accountId;
    j["code"] = line.code;
    j["name"] = line.name;
    j["value"] = line.value.toString();
    j["account_type"] = line.accountType;
    j["parent_guid"] = line.parentId ? nlohmann::json(*line.parentId) : nlohmann::json(nullptr);
    j["is_placeholder"] = line.placeholder;
    j["is_subtotal"] = line.isSubtotal;
    return j;
}

ReportLine lineFromJson(const nlohmann::json& j) {
    ReportLine line;
    line.accountId = j.at("guid").get<std::string>();
    line.code = j.at("code").get<std::string>();
    line.name = j.at("name").get<std::string>();
    line.value = Decimal::fromString(j.at("value").get<std::string>());
    line.accountType = j.at("account_type").get<std::string>();
    if (!j.at("parent_guid").is_null()) {
        line.parentId = j.at("parent_guid").get<std::string>();
    }
    line.placeholder = j.at("is_placeholder").get<bool>();
    line.isSubtotal = j.at("is_subtotal").get<bool>();
    return line;
}

nlohmann::json linesToJson(const std::vector<ReportLine>& lines) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& line : lines) {
        array.push_back(lineToJson(line));
    }
    return array;
}

std::vector<ReportLine> linesFromJson(const nlohmann::json& array) {
    std::vector<ReportLine> lines;
    for (const auto& item : array) {
        lines.push_back(lineFromJson(item));
    }
    return lines;
}

Decimal decimalAt(const nlohmann::json& j, const char* key) {
    return Decimal::fromString(j.at(key).get<std::string>());
}

Date dateAt(const nlohmann::json& j, const char* key) {
    return Date::fromString(j.at(key).get<std::string>());
}

nlohmann::json sectionToJson(const CashflowSection& section) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& line : section.items) {
        items.push_back({
            {"cashflow_type_id", line.cashflowTypeId},
            {"category_name", line.categoryName},
            {"direction", toString(line.direction)},
            {"amount", line.amount.toString()}
        });
    }

    nlohmann::json j;
    j["item_list"] = items;
    j["inflow"] = section.inflow.toString();
    j["outflow"] = section.outflow.toString();
    j["net"] = section.net.toString();
    return j;
}

CashflowSection sectionFromJson(const nlohmann::json& j) {
    CashflowSection section;
    for (const auto& item : j.at("item_list")) {
        CashflowLine line;
        line.cashflowTypeId = item.at("cashflow_type_id").get<int64_t>();
        line.categoryName = item.at("category_name").get<std::string>();
        line.direction = cashflowDirectionFromString(item.at("direction").get<std::string>());
        line.amount = decimalAt(item, "amount");
        section.items.push_back(std::move(line));
    }
    section.inflow = decimalAt(j, "inflow");
    section.outflow = decimalAt(j, "outflow");
    section.net = decimalAt(j, "net");
    return section;
}

} // namespace

nlohmann::json toJson(const BalanceSheet& sheet) {
    nlohmann::json j;
    j["report_date"] = sheet.reportDate.toString();
    j["assets"] = linesToJson(sheet.assets);
    j["liabilities"] = linesToJson(sheet.liabilities);
    j["equity"] = linesToJson(sheet.equity);
    j["asset_total"] = sheet.assetTotal.toString();
    j["liability_total"] = sheet.liabilityTotal.toString();
    j["equity_total"] = sheet.equityTotal.toString();
    j["net_income"] = sheet.netIncome.toString();
    j["equity_with_income"] = sheet.equityWithIncome.toString();
    j["total_liability_equity"] = sheet.totalLiabilityEquity.toString();
    j["is_balanced"] = sheet.isBalanced;
    return j;
}

nlohmann::json toJson(const IncomeStatement& statement) {
    nlohmann::json j;
    j["start_date"] = statement.startDate.toString();
    j["end_date"] = statement.endDate.toString();
    j["revenues"] = linesToJson(statement.revenues);
    j["expenses"] = linesToJson(statement.expenses);
    j["revenue_total"] = statement.revenueTotal.toString();
    j["expense_total"] = statement.expenseTotal.toString();
    j["net_income"] = statement.netIncome.toString();
    return j;
}

nlohmann::json toJson(const CashflowStatement& statement) {
    nlohmann::json j;
    j["start_date"] = statement.startDate.toString();
    j["end_date"] = statement.endDate.toString();
    j["operating"] = sectionToJson(statement.operating);
    j["investing"] = sectionToJson(statement.investing);
    j["financing"] = sectionToJson(statement.financing);
    j["total_net"] = statement.totalNet.toString();
    return j;
}

BalanceSheet balanceSheetFromJson(const nlohmann::json& j) {
    BalanceSheet sheet;
    sheet.reportDate = dateAt(j, "report_date");
    sheet.assets = linesFromJson(j.at("assets"));
    sheet.liabilities = linesFromJson(j.at("liabilities"));
    sheet.equity = linesFromJson(j.at("equity"));
    sheet.assetTotal = decimalAt(j, "asset_total");
    sheet.liabilityTotal = decimalAt(j, "liability_total");
    sheet.equityTotal = decimalAt(j, "equity_total");
    sheet.netIncome = decimalAt(j, "net_income");
    sheet.equityWithIncome = decimalAt(j, "equity_with_income");
    sheet.totalLiabilityEquity = decimalAt(j, "total_liability_equity");
    sheet.isBalanced = j.at("is_balanced").get<bool>();
    return sheet;
}

IncomeStatement incomeStatementFromJson(const nlohmann::json& j) {
    IncomeStatement statement;
    statement.startDate = dateAt(j, "start_date");
    statement.endDate = dateAt(j, "end_date");
    statement.revenues = linesFromJson(j.at("revenues"));
    statement.expenses = linesFromJson(j.at("expenses"));
    statement.revenueTotal = decimalAt(j, "revenue_total");
    statement.expenseTotal = decimalAt(j, "expense_total");
    statement.netIncome = decimalAt(j, "net_income");
    return statement;
}

CashflowStatement cashflowStatementFromJson(const nlohmann::json& j) {
    CashflowStatement statement;
    statement.startDate = dateAt(j, "start_date");
    statement.endDate = dateAt(j, "end_date");
    statement.operating = sectionFromJson(j.at("operating"));
    statement.investing = sectionFromJson(j.at("investing"));
    statement.financing = sectionFromJson(j.at("financing"));
    statement.totalNet = decimalAt(j, "total_net");
    return statement;
}

} // namespace bookkeeping::domain
