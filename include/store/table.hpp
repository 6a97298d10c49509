#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include "common/exceptions.hpp"

namespace oj {

/**
 * @brief 以整数编号为主键的记录表
 * 记录类型 T 必须有 uint32_t 类型的成员 id
 * @param <T> 记录类型
 */
template <typename T>
struct table {
    virtual ~table() = default;

    /**
     * @brief 插入一条记录，记录的 id 由表分配
     * @return 分配的 id
     */
    virtual uint32_t insert(T record) = 0;

    /**
     * @brief 根据 record.id 覆盖已有的记录
     * @throw database_error 如果记录不存在
     */
    virtual void update(const T &record) = 0;

    virtual std::optional<T> select_by_id(uint32_t id) const = 0;

    /**
     * @return 按 id 升序排列的所有记录
     */
    virtual std::vector<T> select_all() const = 0;

    virtual size_t count() const = 0;

    /**
     * @brief 清空表并装入给定的记录，保留记录原有的 id
     */
    virtual void reset(const std::vector<T> &records) = 0;
};

/**
 * @brief 保存在内存中的记录表，可以并发访问
 */
template <typename T>
struct memory_table : public table<T> {
    /**
     * @param first_id 第一条插入的记录的 id
     */
    explicit memory_table(uint32_t first_id = 0) : first_id(first_id), next_id(first_id) {}

    uint32_t insert(T record) override {
        std::scoped_lock guard(mut);
        record.id = next_id++;
        uint32_t id = record.id;
        records.emplace(id, std::move(record));
        return id;
    }

    void update(const T &record) override {
        std::scoped_lock guard(mut);
        auto it = records.find(record.id);
        if (it == records.end())
            throw database_error("Record " + std::to_string(record.id) + " does not exist");
        it->second = record;
    }

    std::optional<T> select_by_id(uint32_t id) const override {
        std::scoped_lock guard(mut);
        auto it = records.find(id);
        if (it == records.end()) return std::nullopt;
        return it->second;
    }

    std::vector<T> select_all() const override {
        std::scoped_lock guard(mut);
        std::vector<T> result;
        result.reserve(records.size());
        for (auto &[id, record] : records) result.push_back(record);
        return result;
    }

    size_t count() const override {
        std::scoped_lock guard(mut);
        return records.size();
    }

    void reset(const std::vector<T> &new_records) override {
        std::scoped_lock guard(mut);
        records.clear();
        next_id = first_id;
        for (auto &record : new_records) {
            records[record.id] = record;
            if (record.id >= next_id) next_id = record.id + 1;
        }
    }

private:
    uint32_t first_id;
    uint32_t next_id;
    std::map<uint32_t, T> records;
    mutable std::mutex mut;
};

}  // namespace oj
