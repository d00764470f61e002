/**
 * @file test_construction_pipeline.cpp
 * @brief ConstructionPipeline 构造流程与循环引用测试
 */

#include "test_components.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace atlas::core::lifecycle;
using namespace atlas_test;

namespace {

struct Repository {
    std::string name;
};

struct Consumer {
    std::shared_ptr<Repository> repository;
};

ComponentDescriptor MakeRepository(const ComponentKey& key, bool primary = false) {
    ComponentDescriptor descriptor = MakeDescriptor<Repository>(key, [key]() {
        auto repository = new Repository();
        repository->name = key;
        return repository;
    });
    descriptor.primary = primary;
    return descriptor;
}

ComponentDescriptor MakeConsumer(const ComponentKey& key, bool required = true) {
    ComponentDescriptor descriptor = MakeDescriptor<Consumer>(key);
    descriptor.dependencies.push_back(MakeTypedDependency<Consumer, Repository>("repository",
        [](Consumer& consumer, std::shared_ptr<Repository> repository) { consumer.repository = repository; },
        required));
    return descriptor;
}

/**
 * @brief A -> B -> C 链，C 的初始化可配置为失败
 */
struct Node {
    std::shared_ptr<Node> next;
};

ComponentDescriptor MakeNode(const ComponentKey& key, const ComponentKey& next, EventLog* log = nullptr,
                             bool fail_init = false) {
    ComponentDescriptor descriptor = MakeDescriptor<Node>(key);
    if (!next.empty()) {
        descriptor.dependencies.push_back(MakeDependency<Node, Node>("next", next,
            [](Node& node, std::shared_ptr<Node> value) { node.next = value; }));
    }
    descriptor.init_methods.push_back(MakeCallback<Node>("Init", [key, log, fail_init](Node&) {
        if (fail_init) {
            throw std::runtime_error("init of " + key + " failed");
        }
        if (log) {
            log->Record("init:" + key);
        }
    }));
    return descriptor;
}

class CountingPostProcessor : public ComponentPostProcessor {
public:
    ComponentRef AfterInitialize(const ComponentRef& instance, const ComponentKey& key) override {
        (void)instance;
        (void)key;
        ++after_initialize_calls;
        return ComponentRef();
    }

    int after_initialize_calls = 0;
};

class ShortCircuitPostProcessor : public CountingPostProcessor {
public:
    ComponentRef BeforeInstantiation(const ComponentDescriptor& descriptor) override {
        if (descriptor.key != "short") {
            return ComponentRef();
        }
        auto repository = std::make_shared<Repository>();
        repository->name = "from-hook";
        return ComponentRef::Of(repository);
    }
};

class VetoPostProcessor : public ComponentPostProcessor {
public:
    bool AfterInstantiation(const ComponentRef& instance, const ComponentKey& key) override {
        (void)instance;
        return key != "svcA";
    }
};

class DestructionAwarePostProcessor : public ComponentPostProcessor {
public:
    explicit DestructionAwarePostProcessor(EventLog& log) : log_(log) {}

    bool RequiresDestruction(const ComponentRef& instance, const ComponentKey& key) override {
        (void)instance;
        return key == "tracked";
    }

    void BeforeDestruction(const ComponentRef& instance, const ComponentKey& key) override {
        (void)instance;
        log_.Record("hook:" + key);
    }

private:
    EventLog& log_;
};

} // anonymous namespace

class ConstructionPipelineTest : public ::testing::Test {
protected:
    ComponentContainer container_;
};

/**
 * @brief svcA 与 svcB 相互引用，两者都能解析
 */
TEST_F(ConstructionPipelineTest, ResolvesMutualReferenceBetweenSingletons) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceA()));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceB()));

    auto a = container_.GetComponent<ServiceA>("svcA");
    auto b = container_.GetComponent<ServiceB>("svcB");

    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a->b, b);
    EXPECT_EQ(b->a, a);
    EXPECT_EQ(a->init_calls, 1);
    EXPECT_EQ(b->init_calls, 1);

    EXPECT_EQ(container_.DependentsOf("svcA"), (std::vector<ComponentKey>{"svcB"}));
    EXPECT_EQ(container_.DependentsOf("svcB"), (std::vector<ComponentKey>{"svcA"}));
}

/**
 * @brief 循环解析结果稳定，从任一端请求都得到同一组实例
 */
TEST_F(ConstructionPipelineTest, CycleResolutionIsStable) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceA()));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceB()));

    auto b = container_.GetComponent<ServiceB>("svcB");
    auto a = container_.GetComponent<ServiceA>("svcA");

    EXPECT_EQ(b->a, a);
    EXPECT_EQ(a->b, b);
    EXPECT_EQ(container_.GetComponent<ServiceA>("svcA"), a);
    EXPECT_EQ(container_.GetComponent<ServiceB>("svcB"), b);
    EXPECT_EQ(container_.GetPipeline().GetBuildCount(), 2u);
    EXPECT_FALSE(container_.GetRegistry().HasEarlyReference("svcA"));
}

/**
 * @brief svcB 持有 svcA 的原始早期引用后 svcA 被包装
 */
TEST_F(ConstructionPipelineTest, WrappingAfterEarlyExposureFailsWithRawInjection) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceA()));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceB()));
    container_.AddPostProcessor(std::make_shared<WrappingPostProcessor>("svcA", false));

    try {
        container_.GetComponent("svcA");
        FAIL() << "expected UnresolvedRawInjectionException";
    } catch (const UnresolvedRawInjectionException& e) {
        EXPECT_EQ(e.GetKey(), "svcA");
        EXPECT_EQ(e.GetDependentKeys(), (std::vector<ComponentKey>{"svcB"}));
    }

    EXPECT_FALSE(container_.ContainsFinished("svcA"));
    EXPECT_FALSE(container_.IsInCreation("svcA"));
    EXPECT_FALSE(container_.GetRegistry().HasEarlyReference("svcA"));

    // svcB 持有的原始 svcA 不会被发布，svcB 随之销毁
    EXPECT_FALSE(container_.ContainsFinished("svcB"));
    EXPECT_FALSE(container_.GetDisposal().HasDisposal("svcB"));
}

/**
 * @brief svcA 初始化失败时持有其早期引用的 svcB 被销毁，重试后双方引用一致
 */
TEST_F(ConstructionPipelineTest, FailedBuildDisposesHoldersOfEarlyReference) {
    auto failures_left = std::make_shared<int>(1);
    ComponentDescriptor a = MakeServiceA();
    a.init_methods.push_back(MakeCallback<ServiceA>("Validate", [failures_left](ServiceA&) {
        if (*failures_left > 0) {
            --*failures_left;
            throw std::runtime_error("svcA not ready");
        }
    }));
    ASSERT_TRUE(container_.RegisterDescriptor(a));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceB()));

    try {
        container_.GetComponent("svcA");
        FAIL() << "expected ConstructionFailedException";
    } catch (const ConstructionFailedException& e) {
        EXPECT_EQ(e.GetKey(), "svcA");
        EXPECT_EQ(e.GetStage(), BuildStage::INITIALIZING);
    }

    EXPECT_FALSE(container_.ContainsFinished("svcA"));
    EXPECT_FALSE(container_.ContainsFinished("svcB"));
    EXPECT_FALSE(container_.GetDisposal().HasDisposal("svcB"));
    EXPECT_TRUE(container_.DependentsOf("svcA").empty());
    EXPECT_TRUE(container_.DependentsOf("svcB").empty());

    auto retried_a = container_.GetComponent<ServiceA>("svcA");
    auto retried_b = container_.GetComponent<ServiceB>("svcB");
    EXPECT_EQ(retried_b->a, retried_a);
    EXPECT_EQ(retried_a->b, retried_b);
    EXPECT_EQ(retried_b->init_calls, 1);
}

TEST_F(ConstructionPipelineTest, RawInjectionToleratedWhenConfigured) {
    RegistryConfig config;
    config.allow_raw_injection_despite_wrapping = true;
    container_.ApplyConfig(config);

    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceA()));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceB()));
    auto wrapper = std::make_shared<WrappingPostProcessor>("svcA", false);
    container_.AddPostProcessor(wrapper);

    auto a = container_.GetComponent<ServiceA>("svcA");
    auto b = container_.GetComponent<ServiceB>("svcB");

    EXPECT_TRUE(a->proxy_target != nullptr);
    EXPECT_EQ(b->a.get(), a->proxy_target);
}

/**
 * @brief 早期暴露阶段包装的实例成为最终发布的实例
 */
TEST_F(ConstructionPipelineTest, EarlyExposureWrappingIsPublished) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceA()));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceB()));
    auto wrapper = std::make_shared<WrappingPostProcessor>("svcA", true);
    container_.AddPostProcessor(wrapper);

    auto a = container_.GetComponent<ServiceA>("svcA");
    auto b = container_.GetComponent<ServiceB>("svcB");

    EXPECT_TRUE(a->proxy_target != nullptr);
    EXPECT_EQ(b->a, a);
    EXPECT_TRUE(wrapper->GetProxy().SameInstance(ComponentRef::Of(a)));
    EXPECT_EQ(a->proxy_target->b, b);
}

/**
 * @brief 原型作用域的循环无法解析
 */
TEST_F(ConstructionPipelineTest, PrototypeCycleThrowsAlreadyInCreation) {
    ComponentDescriptor a = MakeServiceA("protoA", "protoB");
    a.scope = ComponentScope::PROTOTYPE;
    ComponentDescriptor b = MakeServiceB("protoB", "protoA");
    b.scope = ComponentScope::PROTOTYPE;
    ASSERT_TRUE(container_.RegisterDescriptor(a));
    ASSERT_TRUE(container_.RegisterDescriptor(b));

    try {
        container_.GetComponent("protoA");
        FAIL() << "expected AlreadyInCreationException";
    } catch (const AlreadyInCreationException& e) {
        EXPECT_EQ(e.GetKey(), "protoA");
    }
}

TEST_F(ConstructionPipelineTest, PrototypeReturnsNewInstanceEachTime) {
    ComponentDescriptor descriptor = MakeDescriptor<Repository>("proto");
    descriptor.scope = ComponentScope::PROTOTYPE;
    ASSERT_TRUE(container_.RegisterDescriptor(descriptor));

    auto first = container_.GetComponent<Repository>("proto");
    auto second = container_.GetComponent<Repository>("proto");
    EXPECT_NE(first, second);
    EXPECT_FALSE(container_.ContainsFinished("proto"));
}

/**
 * @brief 全局禁止循环引用时单例循环失败
 */
TEST_F(ConstructionPipelineTest, SingletonCycleFailsWhenCircularReferencesDisabled) {
    RegistryConfig config;
    config.allow_circular_references = false;
    container_.ApplyConfig(config);

    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceA()));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceB()));

    EXPECT_THROW(container_.GetComponent("svcA"), AlreadyInCreationException);
    EXPECT_FALSE(container_.IsInCreation("svcA"));
    EXPECT_FALSE(container_.IsInCreation("svcB"));
}

TEST_F(ConstructionPipelineTest, SingletonCycleFailsWhenDescriptorForbidsIt) {
    ComponentDescriptor a = MakeServiceA();
    a.allow_circular_references = false;
    ASSERT_TRUE(container_.RegisterDescriptor(a));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceB()));

    EXPECT_THROW(container_.GetComponent("svcA"), AlreadyInCreationException);
}

/**
 * @brief 初始化回调按声明顺序执行
 */
TEST_F(ConstructionPipelineTest, InitializersRunInDeclarationOrder) {
    EventLog log;
    ComponentDescriptor descriptor = MakeDescriptor<Repository>("repo");
    descriptor.init_methods.push_back(MakeCallback<Repository>("first", [&log](Repository&) { log.Record("first"); }));
    descriptor.init_methods.push_back(MakeCallback<Repository>("second", [&log](Repository&) { log.Record("second"); }));
    descriptor.init_methods.push_back(MakeCallback<Repository>("third", [&log](Repository&) { log.Record("third"); }));
    ASSERT_TRUE(container_.RegisterDescriptor(descriptor));

    container_.GetComponent("repo");
    EXPECT_EQ(log.Events(), (std::vector<std::string>{"first", "second", "third"}));
}

/**
 * @brief 嵌套构造失败逐层包装，保留键和阶段
 */
TEST_F(ConstructionPipelineTest, NestedFailureIsWrappedWithKeyAndStage) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeNode("A", "B")));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeNode("B", "C")));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeNode("C", "", nullptr, true)));

    try {
        container_.GetComponent("A");
        FAIL() << "expected ConstructionFailedException";
    } catch (const ConstructionFailedException& e) {
        EXPECT_EQ(e.GetKey(), "A");
        EXPECT_EQ(e.GetStage(), BuildStage::POPULATING);
        EXPECT_EQ(e.GetKeyChain(), (std::vector<ComponentKey>{"A", "B", "C"}));
        EXPECT_EQ(e.GetRootCauseMessage(), "init of C failed");
    }

    for (const auto& key : {"A", "B", "C"}) {
        EXPECT_FALSE(container_.ContainsFinished(key));
        EXPECT_FALSE(container_.IsInCreation(key));
        EXPECT_FALSE(container_.GetRegistry().HasEarlyReference(key));
    }
    EXPECT_GE(container_.GetPipeline().GetFailureCount(), 3u);
}

TEST_F(ConstructionPipelineTest, EmptyProductionFailsAtInstantiation) {
    ComponentDescriptor descriptor = MakeDescriptor<Repository>("empty");
    descriptor.produce = [](const ComponentKey&, const ComponentDescriptor&) { return ComponentRef(); };
    ASSERT_TRUE(container_.RegisterDescriptor(descriptor));

    try {
        container_.GetComponent("empty");
        FAIL() << "expected ConstructionFailedException";
    } catch (const ConstructionFailedException& e) {
        EXPECT_EQ(e.GetKey(), "empty");
        EXPECT_EQ(e.GetStage(), BuildStage::INSTANTIATING);
    }
}

TEST_F(ConstructionPipelineTest, UnknownKeyThrowsNotFound) {
    EXPECT_THROW(container_.GetComponent("nothing"), ComponentNotFoundException);
}

/**
 * @brief depends_on 中的组件先创建
 */
TEST_F(ConstructionPipelineTest, DependsOnCreatesDependenciesFirst) {
    EventLog log;
    ComponentDescriptor app = MakeNode("app", "", &log);
    app.depends_on = {"db", "cache"};
    ASSERT_TRUE(container_.RegisterDescriptor(app));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeNode("db", "", &log)));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeNode("cache", "", &log)));

    container_.GetComponent("app");

    EXPECT_EQ(log.Events(), (std::vector<std::string>{"init:db", "init:cache", "init:app"}));
    EXPECT_EQ(container_.DependentsOf("app"), (std::vector<ComponentKey>{"db", "cache"}));
}

TEST_F(ConstructionPipelineTest, CircularDependsOnFails) {
    ComponentDescriptor x = MakeNode("x", "");
    x.depends_on = {"y"};
    ComponentDescriptor y = MakeNode("y", "");
    y.depends_on = {"x"};
    ASSERT_TRUE(container_.RegisterDescriptor(x));
    ASSERT_TRUE(container_.RegisterDescriptor(y));

    try {
        container_.GetComponent("x");
        FAIL() << "expected ConstructionFailedException";
    } catch (const ConstructionFailedException& e) {
        EXPECT_EQ(e.GetKey(), "x");
        EXPECT_EQ(e.GetStage(), BuildStage::REQUESTED);
    }
}

TEST_F(ConstructionPipelineTest, MissingDependsOnFails) {
    ComponentDescriptor app = MakeNode("app", "");
    app.depends_on = {"missing"};
    ASSERT_TRUE(container_.RegisterDescriptor(app));

    EXPECT_THROW(container_.GetComponent("app"), ConstructionFailedException);
}

/**
 * @brief 按类型注入，多个候选时取主候选
 */
TEST_F(ConstructionPipelineTest, ResolvesDependencyByTypeUsingPrimary) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeRepository("secondary")));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeRepository("main", true)));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeConsumer("consumer")));

    auto consumer = container_.GetComponent<Consumer>("consumer");
    ASSERT_TRUE(consumer->repository);
    EXPECT_EQ(consumer->repository->name, "main");
    EXPECT_EQ(container_.GetComponent<Repository>()->name, "main");
}

TEST_F(ConstructionPipelineTest, AmbiguousTypeFails) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeRepository("first")));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeRepository("second")));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeConsumer("consumer")));

    EXPECT_THROW(container_.GetComponent<Repository>(), AmbiguousComponentException);

    try {
        container_.GetComponent("consumer");
        FAIL() << "expected ConstructionFailedException";
    } catch (const ConstructionFailedException& e) {
        EXPECT_EQ(e.GetStage(), BuildStage::POPULATING);
    }
}

TEST_F(ConstructionPipelineTest, OptionalDependencyMayBeMissing) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeConsumer("consumer", false)));

    auto consumer = container_.GetComponent<Consumer>("consumer");
    EXPECT_FALSE(consumer->repository);

    ASSERT_TRUE(container_.RegisterDescriptor(MakeConsumer("strict", true)));
    EXPECT_THROW(container_.GetComponent("strict"), ConstructionFailedException);
}

/**
 * @brief 直接注册的实例可按键和类型获取
 */
TEST_F(ConstructionPipelineTest, RegisteredInstanceResolvableByKeyAndType) {
    auto repository = std::make_shared<Repository>();
    repository->name = "prebuilt";
    container_.RegisterInstance("repo", repository);
    ASSERT_TRUE(container_.RegisterDescriptor(MakeConsumer("consumer")));

    EXPECT_EQ(container_.GetComponent<Repository>("repo"), repository);
    EXPECT_EQ(container_.GetComponent<Consumer>("consumer")->repository, repository);
    EXPECT_THROW(container_.RegisterInstance("repo", std::make_shared<Repository>()), DuplicateComponentException);
    EXPECT_THROW(container_.GetComponent<Consumer>("repo"), ComponentNotFoundException);
}

/**
 * @brief BeforeInstantiation 返回实例时跳过生产回调，只执行 AfterInitialize
 */
TEST_F(ConstructionPipelineTest, BeforeInstantiationShortCircuits) {
    bool produced = false;
    ComponentDescriptor descriptor = MakeDescriptor<Repository>("short", [&produced]() {
        produced = true;
        return new Repository();
    });
    ASSERT_TRUE(container_.RegisterDescriptor(descriptor));
    auto processor = std::make_shared<ShortCircuitPostProcessor>();
    container_.AddPostProcessor(processor);

    auto repository = container_.GetComponent<Repository>("short");
    EXPECT_FALSE(produced);
    EXPECT_EQ(repository->name, "from-hook");
    EXPECT_EQ(processor->after_initialize_calls, 1);
}

TEST_F(ConstructionPipelineTest, AfterInstantiationVetoSkipsPopulation) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceA()));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceB()));
    container_.AddPostProcessor(std::make_shared<VetoPostProcessor>());

    auto a = container_.GetComponent<ServiceA>("svcA");
    EXPECT_FALSE(a->b);
    EXPECT_FALSE(container_.ContainsFinished("svcB"));
}

TEST_F(ConstructionPipelineTest, SyntheticDescriptorSkipsHooks) {
    ComponentDescriptor descriptor = MakeDescriptor<Repository>("internal");
    descriptor.synthetic = true;
    ASSERT_TRUE(container_.RegisterDescriptor(descriptor));
    auto processor = std::make_shared<CountingPostProcessor>();
    container_.AddPostProcessor(processor);

    container_.GetComponent("internal");
    EXPECT_EQ(processor->after_initialize_calls, 0);
}

/**
 * @brief 预先构造所有单例，跳过原型
 */
TEST_F(ConstructionPipelineTest, PreInstantiateSingletons) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceA()));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeServiceB()));
    ComponentDescriptor proto = MakeDescriptor<Repository>("proto");
    proto.scope = ComponentScope::PROTOTYPE;
    ASSERT_TRUE(container_.RegisterDescriptor(proto));

    EXPECT_EQ(container_.PreInstantiateSingletons(), 2u);
    EXPECT_TRUE(container_.ContainsFinished("svcA"));
    EXPECT_TRUE(container_.ContainsFinished("svcB"));
    EXPECT_FALSE(container_.ContainsFinished("proto"));
}

TEST_F(ConstructionPipelineTest, DestructionAwareHookRunsBeforeDestroyMethod) {
    EventLog log;
    ComponentDescriptor tracked = MakeDescriptor<Repository>("tracked");
    tracked.destroy_method = MakeCallback<Repository>("Close", [&log](Repository&) { log.Record("destroy:tracked"); });
    ASSERT_TRUE(container_.RegisterDescriptor(tracked));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeDescriptor<Repository>("plain")));
    container_.AddPostProcessor(std::make_shared<DestructionAwarePostProcessor>(log));

    container_.GetComponent("tracked");
    container_.GetComponent("plain");
    EXPECT_TRUE(container_.GetDisposal().HasDisposal("tracked"));
    EXPECT_FALSE(container_.GetDisposal().HasDisposal("plain"));

    container_.Shutdown();
    EXPECT_EQ(log.Events(), (std::vector<std::string>{"hook:tracked", "destroy:tracked"}));
}

/**
 * @brief 自定义依赖解析器
 */
TEST_F(ConstructionPipelineTest, CustomDependencyResolver) {
    class FixedResolver : public DependencyResolver {
    public:
        ResolvedDependency ResolveDependency(const DependencyPoint& point, const ComponentKey& requesting_key,
                                             const BuildContext& context) override {
            (void)point;
            (void)requesting_key;
            EXPECT_EQ(context.CurrentKey(), "consumer");
            auto repository = std::make_shared<Repository>();
            repository->name = "fixed";
            return ResolvedDependency{"fixed", ComponentRef::Of(repository)};
        }
    };

    container_.GetPipeline().SetDependencyResolver(std::make_shared<FixedResolver>());
    ASSERT_TRUE(container_.RegisterDescriptor(MakeConsumer("consumer")));

    EXPECT_EQ(container_.GetComponent<Consumer>("consumer")->repository->name, "fixed");
    EXPECT_EQ(container_.DependentsOf("consumer"), (std::vector<ComponentKey>{"fixed"}));
}

namespace {

class Clock {
public:
    virtual ~Clock() = default;
    virtual int Now() const = 0;
};

class FixedClock : public Clock {
public:
    int Now() const override { return 42; }
};

struct Scheduler {
    std::shared_ptr<Clock> clock;
};

ComponentDescriptor MakeScheduler(const ComponentKey& key) {
    ComponentDescriptor descriptor = MakeDescriptor<Scheduler>(key);
    descriptor.dependencies.push_back(MakeTypedDependency<Scheduler, Clock>("clock",
        [](Scheduler& scheduler, std::shared_ptr<Clock> clock) { scheduler.clock = clock; }));
    return descriptor;
}

} // anonymous namespace

/**
 * @brief 实现类声明暴露的接口后可按接口类型注入
 */
TEST_F(ConstructionPipelineTest, InjectsByExposedInterfaceType) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeDescriptor<FixedClock, Clock>("clock")));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeScheduler("scheduler")));

    auto scheduler = container_.GetComponent<Scheduler>("scheduler");
    ASSERT_TRUE(scheduler->clock);
    EXPECT_EQ(scheduler->clock->Now(), 42);

    auto concrete = container_.GetComponent<FixedClock>("clock");
    EXPECT_EQ(scheduler->clock.get(), static_cast<Clock*>(concrete.get()));
    EXPECT_EQ(container_.GetComponent<Clock>("clock"), scheduler->clock);
    EXPECT_EQ(container_.GetComponent<Clock>(), scheduler->clock);
}

TEST_F(ConstructionPipelineTest, UndeclaredInterfaceIsNotMatched) {
    ASSERT_TRUE(container_.RegisterDescriptor(MakeDescriptor<FixedClock>("clock")));
    ASSERT_TRUE(container_.RegisterDescriptor(MakeScheduler("scheduler")));

    EXPECT_THROW(container_.GetComponent<Clock>(), ComponentNotFoundException);
    EXPECT_THROW(container_.GetComponent("scheduler"), ConstructionFailedException);
}

TEST_F(ConstructionPipelineTest, RegisteredInstanceInjectableByExposedInterface) {
    auto clock = std::make_shared<FixedClock>();
    container_.RegisterInstance<FixedClock, Clock>("clock", clock);
    ASSERT_TRUE(container_.RegisterDescriptor(MakeScheduler("scheduler")));

    auto scheduler = container_.GetComponent<Scheduler>("scheduler");
    EXPECT_EQ(scheduler->clock.get(), static_cast<Clock*>(clock.get()));
}
