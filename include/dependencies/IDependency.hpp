#pragma once

namespace depcache::ports::input {
class ICache;
}

namespace depcache::dependencies {

/**
 * @brief Интерфейс зависимости кэшированного значения
 *
 * Зависимость снимает состояние внешнего источника в момент записи
 * (evaluateDependency) и при чтении сообщает, изменилось ли оно
 * (isChanged). Если изменилось - Cache считает значение отсутствующим.
 *
 * Кэш передаётся в оба метода: некоторые зависимости (TagDependency)
 * хранят своё состояние в том же кэше.
 *
 * @note Экземпляр не потокобезопасен: первое вычисление из двух
 *       потоков одновременно - гонка. Используйте отдельный экземпляр
 *       на операцию записи или внешнюю синхронизацию.
 */
class IDependency {
public:
    virtual ~IDependency() = default;

    /**
     * @brief Снять и запомнить текущее состояние
     */
    virtual void evaluateDependency(ports::input::ICache& cache) = 0;

    /**
     * @brief Было ли состояние уже снято
     *
     * Cache вызывает evaluateDependency() только если здесь false,
     * поэтому один экземпляр можно переиспользовать между записями.
     */
    virtual bool isEvaluated() const = 0;

    /**
     * @brief Сравнить текущее состояние со снятым
     *
     * @return true если значение, записанное с этой зависимостью, устарело
     */
    virtual bool isChanged(ports::input::ICache& cache) = 0;
};

} // namespace depcache::dependencies
