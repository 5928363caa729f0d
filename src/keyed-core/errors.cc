#include "errors.hh"

#include <format>
#include <utility>

kc::map_error::map_error(std::string message, kc::source_location site) : _message(std::move(message)), _site(site)
{
}

char const* kc::map_error::what() const noexcept
{
    return _message.c_str();
}

std::string kc::map_error::to_string() const
{
    return std::format("error: {}\n  at {}:{} - {}\n", _message, _site.file_name(), _site.line(), _site.function_name());
}

kc::index_out_of_range_error::index_out_of_range_error(std::string message, isize index, isize size, kc::source_location site)
  : map_error(std::move(message), site), _index(index), _size(size)
{
}

void kc::impl::throw_duplicate_key(kc::source_location site)
{
    throw kc::duplicate_key_error("an entry with the same key already exists", site);
}

void kc::impl::throw_key_not_found(kc::source_location site)
{
    throw kc::key_not_found_error("the key is not present", site);
}

void kc::impl::throw_index_out_of_range(char const* operation, isize index, isize end, bool end_inclusive, kc::source_location site)
{
    auto message = std::format("{}: index {} is out of range [0, {}{}", operation, index, end, end_inclusive ? "]" : ")");
    throw kc::index_out_of_range_error(std::move(message), index, end, site);
}

void kc::impl::throw_invalid_argument(std::string message, kc::source_location site)
{
    throw kc::invalid_argument_error(std::move(message), site);
}
