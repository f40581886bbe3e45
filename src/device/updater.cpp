#include "device/updater.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <set>
#include <stdexcept>
#include <utility>

namespace ljdaq::device
{

Updater::Updater(Driver &driver, int handle, std::vector<std::string> write_names,
                 std::vector<std::string> read_names)
    : m_driver(&driver), m_handle(handle), m_write_names(std::move(write_names)),
      m_read_names(std::move(read_names))
{
    LOGGER_DEBUG("Updater: write [{}], read [{}]", format_tools::join(m_write_names),
                 format_tools::join(m_read_names));
}

Updater::Updater(Driver &driver, int handle, std::string write_name, std::string read_name)
    : Updater(driver, handle, std::vector<std::string>{std::move(write_name)},
              std::vector<std::string>{std::move(read_name)})
{
}

Updater Updater::same_registers(Driver &driver, int handle, std::vector<std::string> names)
{
    std::vector<std::string> read_names = names;
    return Updater(driver, handle, std::move(names), std::move(read_names));
}

bool Updater::has_same_registers() const
{
    return std::set<std::string>(m_write_names.begin(), m_write_names.end()) ==
           std::set<std::string>(m_read_names.begin(), m_read_names.end());
}

Readings Updater::batch_read(const std::vector<std::string> &names)
{
    auto values = m_driver->read_names(m_handle, names);
    Readings out;
    for (std::size_t i = 0; i < names.size() && i < values.size(); ++i)
        out[names[i]] = values[i];
    return out;
}

Readings Updater::read()
{
    return batch_read(m_read_names);
}

void Updater::check_length(const std::vector<double> &values) const
{
    if (values.size() != m_write_names.size())
        throw std::invalid_argument(
            "Length of data to write doesn't match number of write registers");
}

void Updater::write(const std::vector<double> &values)
{
    check_length(values);
    m_driver->write_names(m_handle, m_write_names, values);
}

void Updater::write(double value)
{
    write(std::vector<double>{value});
}

Readings Updater::update(const std::vector<double> &values)
{
    write(values);
    return has_same_registers() ? batch_read(m_write_names) : read();
}

Readings Updater::update(double value)
{
    return update(std::vector<double>{value});
}

} // namespace ljdaq::device
