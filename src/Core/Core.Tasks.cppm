module;

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

export module Core:Tasks;

export namespace Core::Tasks
{
    // A fixed-size, non-allocating task wrapper.
    class LocalTask
    {
        static constexpr size_t STORAGE_SIZE = 120;

        struct Concept
        {
            virtual ~Concept() = default;
            virtual void Execute() = 0;
            virtual void MoveTo(void* dest) = 0;
        };

        template <typename T>
        struct Model final : Concept
        {
            T payload;

            explicit Model(T&& p) : payload(std::move(p))
            {
            }

            void Execute() override { payload(); }

            void MoveTo(void* dest) override
            {
                std::construct_at(static_cast<Model<T>*>(dest), std::move(payload));
            }
        };

        alignas(8) std::byte m_Storage[STORAGE_SIZE];
        Concept* m_VTable = nullptr; // Points to m_Storage (reinterpreted)

    public:
        LocalTask() = default;

        template <typename F>
            requires (!std::is_same_v<std::decay_t<F>, LocalTask>)
        LocalTask(F&& f)
        {
            using Type = std::decay_t<F>;
            static_assert(sizeof(Model<Type>) <= STORAGE_SIZE,
                          "Task lambda capture is too big! Use pointers or simplify captures.");
            static_assert(alignof(Model<Type>) <= alignof(std::max_align_t),
                          "Task alignment requirement too strict.");

            auto* ptr = reinterpret_cast<Model<Type>*>(m_Storage);
            std::construct_at(ptr, Type(std::forward<F>(f)));
            m_VTable = ptr;
        }

        ~LocalTask();

        LocalTask(LocalTask&& other) noexcept;
        LocalTask& operator=(LocalTask&& other) noexcept;

        LocalTask(const LocalTask&) = delete;
        LocalTask& operator=(const LocalTask&) = delete;

        void operator()();

        [[nodiscard]] bool Valid() const { return m_VTable != nullptr; }
    };

    // Process-wide worker pool. Residency fetches run here; everything that
    // touches residency state stays on the calling thread.
    class Scheduler
    {
    public:
        static void Initialize(unsigned threadCount = 0);
        static void Shutdown();

        [[nodiscard]] static bool IsRunning();
        [[nodiscard]] static unsigned GetWorkerCount();

        // Returns false (and drops nothing) when the scheduler is not running;
        // the caller decides whether to execute the work inline instead.
        template <typename F>
        static bool Dispatch(F&& task)
        {
            if (!IsRunning()) return false;
            DispatchInternal(LocalTask(std::forward<F>(task)));
            return true;
        }

        static void WaitForAll();

    private:
        static void DispatchInternal(LocalTask&& task);
        static void WorkerEntry(unsigned threadIndex);
    };
}
