#pragma once

#include "domain/Adapter.hpp"
#include "domain/AdvancedProperty.hpp"

#include <optional>
#include <string>
#include <vector>

// Falhas de plataforma são lançadas como std::runtime_error com a saída do comando.
struct NetworkAdapter {
    virtual ~NetworkAdapter() = default;
    virtual std::vector<Adapter> listAdapters() = 0;
    virtual std::optional<AdvancedProperty> getProperty(const std::string& adapter,
                                                        const std::string& name) = 0;
    virtual void setProperty(const std::string& adapter,
                             const std::string& name,
                             const std::string& value) = 0;
    virtual void restart(const std::string& adapter) = 0;
};
