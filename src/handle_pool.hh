#ifndef CHIPVIEW_HANDLE_POOL_HH
#define CHIPVIEW_HANDLE_POOL_HH
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

// Index into a handle_pool slot plus the generation the slot had when the
// handle was given out. Default-constructed handles never refer to anything.
struct resource_handle
{
    uint32_t index = UINT32_MAX;
    uint32_t generation = 0;

    bool operator==(const resource_handle& other) const
    {
        return index == other.index && generation == other.generation;
    }
    bool operator!=(const resource_handle& other) const
    {
        return !operator==(other);
    }
};

// Slot arena with generational handles. Erasing an entry bumps the slot's
// generation, so old handles to a reused slot are rejected.
template<typename T>
class handle_pool
{
public:
    template<typename... Args>
    resource_handle emplace(Args&&... args);

    // Returns false if the handle was already stale.
    bool erase(resource_handle handle);

    T* get(resource_handle handle);
    const T* get(resource_handle handle) const;
    bool contains(resource_handle handle) const;

    size_t size() const;
    void clear();

    template<typename F>
    void for_each(F&& f);

private:
    struct slot
    {
        std::optional<T> value;
        uint32_t generation = 1;
    };

    const slot* find(resource_handle handle) const;

    std::vector<slot> slots;
    std::vector<uint32_t> free_slots;
    size_t count = 0;
};

template<typename T>
template<typename... Args>
resource_handle handle_pool<T>::emplace(Args&&... args)
{
    uint32_t index;
    if(free_slots.size() > 0)
    {
        index = free_slots.back();
        free_slots.pop_back();
    }
    else
    {
        index = slots.size();
        slots.emplace_back();
    }

    slot& s = slots[index];
    s.value.emplace(std::forward<Args>(args)...);
    count++;
    return {index, s.generation};
}

template<typename T>
bool handle_pool<T>::erase(resource_handle handle)
{
    if(!find(handle)) return false;

    slot& s = slots[handle.index];
    s.value.reset();
    s.generation++;
    free_slots.push_back(handle.index);
    count--;
    return true;
}

template<typename T>
T* handle_pool<T>::get(resource_handle handle)
{
    const slot* s = find(handle);
    return s ? &slots[handle.index].value.value() : nullptr;
}

template<typename T>
const T* handle_pool<T>::get(resource_handle handle) const
{
    const slot* s = find(handle);
    return s ? &s->value.value() : nullptr;
}

template<typename T>
bool handle_pool<T>::contains(resource_handle handle) const
{
    return find(handle) != nullptr;
}

template<typename T>
size_t handle_pool<T>::size() const
{
    return count;
}

template<typename T>
void handle_pool<T>::clear()
{
    for(uint32_t i = 0; i < slots.size(); ++i)
    {
        if(slots[i].value)
        {
            slots[i].value.reset();
            slots[i].generation++;
            free_slots.push_back(i);
        }
    }
    count = 0;
}

template<typename T>
template<typename F>
void handle_pool<T>::for_each(F&& f)
{
    for(uint32_t i = 0; i < slots.size(); ++i)
    {
        if(slots[i].value)
            f(resource_handle{i, slots[i].generation}, *slots[i].value);
    }
}

template<typename T>
const typename handle_pool<T>::slot*
handle_pool<T>::find(resource_handle handle) const
{
    if(handle.index >= slots.size()) return nullptr;
    const slot& s = slots[handle.index];
    if(!s.value || s.generation != handle.generation) return nullptr;
    return &s;
}

#endif
