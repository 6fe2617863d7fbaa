module;

#include <algorithm>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

export module Utils.BoundedHeap;

export namespace Utils
{
    // Keeps the k *smallest* T under Compare. Top() = current worst (largest) in the heap.
    // Compare must be a strict weak ordering; break ties inside it when the selection
    // has to be deterministic.
    template <typename T, typename Compare = std::less<T>>
    class BoundedHeap
    {
    public:
        explicit BoundedHeap(size_t maxSize, Compare comp = Compare{})
            : m_MaxSize(maxSize), m_Comp(std::move(comp))
        {
            m_Data.reserve(m_MaxSize);
        }

        // Ignores the item if the heap is full and the item is not better than the current worst.
        void Push(const T& item)
        {
            if (m_MaxSize == 0) return;

            if (m_Data.size() < m_MaxSize)
            {
                m_Data.push_back(item);
                std::push_heap(m_Data.begin(), m_Data.end(), m_Comp);
            }
            else if (m_Comp(item, m_Data.front()))
            {
                std::pop_heap(m_Data.begin(), m_Data.end(), m_Comp);
                m_Data.back() = item;
                std::push_heap(m_Data.begin(), m_Data.end(), m_Comp);
            }
        }

        // Precondition: not empty.
        [[nodiscard]] const T& Top() const { return m_Data.front(); }

        [[nodiscard]] std::size_t Size() const { return m_Data.size(); }
        [[nodiscard]] bool Empty() const { return m_Data.empty(); }
        [[nodiscard]] std::size_t Capacity() const { return m_MaxSize; }
        [[nodiscard]] bool IsFull() const { return m_Data.size() >= m_MaxSize; }

        void Clear() { m_Data.clear(); }

        // Ascending (best..worst) copy; the heap stays intact.
        [[nodiscard]] std::vector<T> GetSortedData() const
        {
            std::vector<T> out = m_Data;
            std::sort(out.begin(), out.end(), m_Comp);
            return out;
        }

        // Ascending (best..worst); leaves the heap empty.
        [[nodiscard]] std::vector<T> TakeSorted()
        {
            std::sort_heap(m_Data.begin(), m_Data.end(), m_Comp);
            std::vector<T> out = std::move(m_Data);
            m_Data.clear();
            return out;
        }

    private:
        std::size_t m_MaxSize;
        Compare m_Comp;
        std::vector<T> m_Data; // max-heap under m_Comp (largest at front)
    };
}
